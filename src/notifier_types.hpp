/**
 * @file notifier_types.hpp
 * @brief Shared types for mpris-notifier
 */

#pragma once

#include <map>
#include <variant>

#include <Drac++/Utils/Types.hpp>

namespace mpris_notifier {
  using namespace draconis::utils::types;

  /**
   * @brief MPRIS playback state
   */
  enum class PlaybackStatus : u8 {
    Unknown,
    Playing,
    Paused,
    Stopped,
  };

  /**
   * @brief Snapshot of a player's current media item
   */
  struct TrackMetadata {
    Option<String> title;
    Vec<String>    artists;
    Option<String> album;
    Option<String> artUri;
    PlaybackStatus playbackStatus = PlaybackStatus::Unknown;

    Vec<String>    albumArtists;
    Option<u32>    trackNumber;
    Option<String> trackId;
    Option<String> url;
  };

  /**
   * @brief The subset of TrackMetadata used for deduplication
   */
  struct TrackIdentity {
    Option<String> title;
    Vec<String>    artists;
    Option<String> album;

    [[nodiscard]] auto isEmpty() const -> bool {
      return !title && artists.empty() && !album;
    }

    auto operator==(const TrackIdentity&) const -> bool = default;
  };

  /**
   * @brief Raw-pixel image in the freedesktop `image-data` layout
   */
  struct ImageData {
    u32     width         = 0;
    u32     height        = 0;
    bool    hasAlpha      = false;
    u32     bitsPerSample = 8;
    u32     channels      = 3;
    u32     rowstride     = 0;
    Vec<u8> pixels;
  };

  struct RenderedNotification {
    String            subject;
    String            body;
    Option<ImageData> icon;
  };

  /**
   * @brief A status change that warrants a notification when the track is unchanged
   * @details When `anyFrom` is set, `from` is ignored.
   */
  struct StatusTransition {
    PlaybackStatus from    = PlaybackStatus::Unknown;
    PlaybackStatus to      = PlaybackStatus::Unknown;
    bool           anyFrom = false;

    auto operator==(const StatusTransition&) const -> bool = default;
  };

  // Loosely-typed value decoded from a D-Bus message. Variants are unwrapped
  // while decoding and structs are represented as arrays.
  struct BusValue;
  using BusArray = Vec<BusValue>;
  using BusDict  = std::map<String, BusValue>;

  struct BusValue {
    std::variant<std::monostate, bool, i64, u64, f64, String, BusArray, BusDict> data;
  };

  struct PropertiesChangedEvent {
    String  sourceId;
    BusDict properties;
  };

  struct PeerRemovedEvent {
    String sourceId;
  };

  using BusEvent = std::variant<PropertiesChangedEvent, PeerRemovedEvent>;

  /**
   * @brief Returns the MPRIS spelling of a status, or an empty view for Unknown
   */
  constexpr auto StatusName(const PlaybackStatus status) -> StringView {
    switch (status) {
      case PlaybackStatus::Playing: return "Playing";
      case PlaybackStatus::Paused:  return "Paused";
      case PlaybackStatus::Stopped: return "Stopped";
      case PlaybackStatus::Unknown: return "";
    }
    return "";
  }
} // namespace mpris_notifier
