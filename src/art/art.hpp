/**
 * @file art.hpp
 * @brief Best-effort album art retrieval for notifications
 *
 * @details Art is loaded from `file://` URIs (or bare absolute paths) and
 * from `http(s)://` URLs, decoded with gdk-pixbuf, shrunk to fit within
 * THUMBNAIL_SIZE and converted to the raw `image-data` layout. Every
 * failure collapses into an empty result: the notification is always sent,
 * with or without art.
 */

#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <span>
#include <thread>

#include <Drac++/Utils/Error.hpp>
#include <Drac++/Utils/Logging.hpp>

#include "../notifier_types.hpp"

namespace mpris_notifier::art {
  inline constexpr usize ART_SIZE_LIMIT = 5'000'000; // bytes, for downloads and local files
  inline constexpr u32   THUMBNAIL_SIZE = 256;

  // Declared dimensions above this are refused before any pixels are decoded.
  inline constexpr u64 MAX_SOURCE_PIXELS = 4096ULL * 4096ULL;

  /**
   * @brief Interface for album art sources
   */
  class IArtFetcher {
   public:
    IArtFetcher()                                      = default;
    virtual ~IArtFetcher()                             = default;
    IArtFetcher(const IArtFetcher&)                    = delete;
    auto operator=(const IArtFetcher&) -> IArtFetcher& = delete;
    IArtFetcher(IArtFetcher&&)                         = default;
    auto operator=(IArtFetcher&&) -> IArtFetcher&      = default;

    /**
     * @brief Retrieves the art at `uri`, giving up after `deadline`
     * @return The image, or None on any failure or when the deadline passes
     */
    virtual auto fetch(const String& uri, std::chrono::milliseconds deadline) -> Option<ImageData> = 0;
  };

  /**
   * @brief Fetches local and HTTP(S) art with gdk-pixbuf decoding
   */
  class ArtFetcher : public IArtFetcher {
   public:
    auto fetch(const String& uri, std::chrono::milliseconds deadline) -> Option<ImageData> override;
  };

  /**
   * @brief Runs `task` on a detached worker and waits at most `deadline` for it
   * @details On expiry the worker is abandoned. It only owns its captures and
   * the shared result slot, so it can finish (or keep blocking) without
   * touching any state of the caller.
   */
  template <typename Task>
  auto RunWithDeadline(Task task, const std::chrono::milliseconds deadline) -> Option<ImageData> {
    auto                           slot    = std::make_shared<std::promise<Result<ImageData>>>();
    std::future<Result<ImageData>> pending = slot->get_future();

    std::thread([slot, task = std::move(task)]() mutable -> void {
      try {
        slot->set_value(task());
      } catch (const std::exception& e) {
        slot->set_value(Err(draconis::utils::error::DracError { draconis::utils::error::DracErrorCode::InternalError, e.what() }));
      }
    }).detach();

    if (pending.wait_for(deadline) != std::future_status::ready) {
      debug_log("Album art fetch abandoned after {}ms", deadline.count());
      return None;
    }

    Result<ImageData> result = pending.get();
    if (!result) {
      debug_log("Album art unavailable: {}", result.error().message);
      return None;
    }

    return std::move(*result);
  }

  /**
   * @brief Global libcurl setup; call once before any worker thread starts
   */
  auto Initialize() -> Result<>;

  /**
   * @brief Reads the raw bytes behind `uri`
   * @param uri `file://` URI, absolute path, or `http(s)://` URL
   * @param timeout Transfer timeout for network URLs
   */
  auto LoadBytes(const String& uri, std::chrono::milliseconds timeout) -> Result<Vec<u8>>;

  /**
   * @brief Decodes an encoded raster image and converts it to ImageData
   * @details Images larger than `maxSize` in either dimension are scaled
   * down, keeping their aspect ratio. Rows in the result are tightly packed.
   */
  auto DecodeImage(std::span<const u8> bytes, u32 maxSize = THUMBNAIL_SIZE) -> Result<ImageData>;

  /**
   * @brief LoadBytes followed by DecodeImage, on the calling thread
   */
  auto FetchBlocking(const String& uri, std::chrono::milliseconds timeout) -> Result<ImageData>;
} // namespace mpris_notifier::art
