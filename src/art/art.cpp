/**
 * @file art.cpp
 * @brief Best-effort album art retrieval for notifications
 */

#include "art.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <curl/curl.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <gdk-pixbuf/gdk-pixbuf.h>
#include <iterator>
#include <matchit.hpp>
#include <utility>

#include <Drac++/Utils/Error.hpp>
#include <Drac++/Utils/Logging.hpp>
#include <Drac++/Utils/Types.hpp>

namespace fs = std::filesystem;

using namespace draconis::utils::types;
using namespace draconis::utils::error;
using enum DracErrorCode;

#ifndef MPRIS_NOTIFIER_VERSION
  #define MPRIS_NOTIFIER_VERSION "0.0.0"
#endif

namespace mpris_notifier::art::curl {
  struct EasyOptions {
    Option<String> url              = None;
    Vec<u8>*       writeBuffer      = nullptr;
    Option<i64>    timeoutMs        = None;
    Option<i64>    connectTimeoutMs = None;
    Option<String> userAgent        = None;
    usize          maxBytes         = ART_SIZE_LIMIT;
  };

  class Easy {
    struct WriteTarget {
      Vec<u8>* buffer   = nullptr;
      usize    maxBytes = 0;
    };

    CURL*             m_curl      = nullptr;
    Option<DracError> m_initError = None;
    WriteTarget       m_target;

    // Returning less than the chunk size aborts the transfer with CURLE_WRITE_ERROR.
    static auto writeCallback(RawPointer contents, const usize size, const usize nmemb, WriteTarget* target) -> usize {
      const usize totalSize = size * nmemb;
      if (target->buffer->size() + totalSize > target->maxBytes)
        return 0;
      const auto* bytes = static_cast<const u8*>(contents);
      target->buffer->insert(target->buffer->end(), bytes, bytes + totalSize);
      return totalSize;
    }

   public:
    explicit Easy(const EasyOptions& options) : m_curl(curl_easy_init()) {
      if (!m_curl) {
        m_initError = DracError(ApiUnavailable, "curl_easy_init() failed");
        return;
      }

      if (options.url)
        if (Result<> res = setUrl(*options.url); !res) {
          m_initError = res.error();
          return;
        }

      if (options.writeBuffer)
        if (Result<> res = setWriteBuffer(options.writeBuffer, options.maxBytes); !res) {
          m_initError = res.error();
          return;
        }

      if (options.timeoutMs)
        if (Result<> res = setOpt(CURLOPT_TIMEOUT_MS, static_cast<long>(*options.timeoutMs)); !res) {
          m_initError = res.error();
          return;
        }

      if (options.connectTimeoutMs)
        if (Result<> res = setOpt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(*options.connectTimeoutMs)); !res) {
          m_initError = res.error();
          return;
        }

      if (options.userAgent)
        if (Result<> res = setOpt(CURLOPT_USERAGENT, options.userAgent->c_str()); !res) {
          m_initError = res.error();
          return;
        }

      // NOSIGNAL: transfers run on worker threads, so timeouts must not use SIGALRM.
      for (const CURLoption flag : { CURLOPT_NOSIGNAL, CURLOPT_FOLLOWLOCATION, CURLOPT_FAILONERROR })
        if (Result<> res = setOpt(flag, 1L); !res) {
          m_initError = res.error();
          return;
        }
    }

    ~Easy() {
      if (m_curl)
        curl_easy_cleanup(m_curl);
    }

    Easy(const Easy&)                    = delete;
    auto operator=(const Easy&) -> Easy& = delete;
    Easy(Easy&&)                         = delete;
    auto operator=(Easy&&) -> Easy&      = delete;

    [[nodiscard]] explicit operator bool() const {
      return m_curl != nullptr && !m_initError;
    }

    [[nodiscard]] auto getInitializationError() const -> const Option<DracError>& {
      return m_initError;
    }

    template <typename T>
    auto setOpt(const CURLoption option, T value) -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized");
      if (const CURLcode res = curl_easy_setopt(m_curl, option, value); res != CURLE_OK)
        ERR_FMT(PlatformSpecific, "curl_easy_setopt failed: {}", curl_easy_strerror(res));
      return {};
    }

    auto perform() -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized");
      if (m_initError)
        ERR_FMT(InternalError, "CURL init failed: {}", m_initError->message);
      if (const CURLcode res = curl_easy_perform(m_curl); res != CURLE_OK)
        ERR_FMT(ApiUnavailable, "curl_easy_perform failed: {}", curl_easy_strerror(res));
      return {};
    }

    auto setUrl(const String& url) -> Result<> {
      return setOpt(CURLOPT_URL, url.c_str());
    }

    auto setWriteBuffer(Vec<u8>* buffer, const usize maxBytes) -> Result<> {
      if (!buffer)
        ERR(InvalidArgument, "Write buffer cannot be null");
      m_target = WriteTarget { .buffer = buffer, .maxBytes = maxBytes };
      if (Result<> res = setOpt(CURLOPT_WRITEFUNCTION, writeCallback); !res)
        return res;
      if (Result<> res = setOpt(CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(maxBytes)); !res)
        return res;
      return setOpt(CURLOPT_WRITEDATA, &m_target);
    }
  };

  /**
   * @brief RAII wrapper for a CURLU URL handle
   */
  class Url {
    CURLU* m_url = nullptr;

    auto getPart(const CURLUPart part, const u32 flags) const -> Result<String> {
      char* value = nullptr;
      if (const CURLUcode res = curl_url_get(m_url, part, &value, flags); res != CURLUE_OK)
        ERR_FMT(ParseError, "curl_url_get failed: {}", curl_url_strerror(res));
      String result(value);
      curl_free(value);
      return result;
    }

    explicit Url(CURLU* url) : m_url(url) {}

   public:
    ~Url() {
      if (m_url)
        curl_url_cleanup(m_url);
    }

    Url(const Url&)                    = delete;
    auto operator=(const Url&) -> Url& = delete;

    Url(Url&& other) noexcept
      : m_url(std::exchange(other.m_url, nullptr)) {}

    auto operator=(Url&& other) noexcept -> Url& {
      if (this != &other) {
        if (m_url)
          curl_url_cleanup(m_url);
        m_url = std::exchange(other.m_url, nullptr);
      }
      return *this;
    }

    static auto parse(const String& text) -> Result<Url> {
      CURLU* raw = curl_url();
      if (!raw)
        ERR(OutOfMemory, "curl_url failed");

      Url url(raw);
      if (const CURLUcode res = curl_url_set(raw, CURLUPART_URL, text.c_str(), CURLU_NON_SUPPORT_SCHEME); res != CURLUE_OK)
        ERR_FMT(ParseError, "Invalid art URI '{}': {}", text, curl_url_strerror(res));

      return url;
    }

    [[nodiscard]] auto scheme() const -> Result<String> {
      return getPart(CURLUPART_SCHEME, 0);
    }

    [[nodiscard]] auto path() const -> Result<String> {
      return getPart(CURLUPART_PATH, CURLU_URLDECODE);
    }
  };
} // namespace mpris_notifier::art::curl

namespace mpris_notifier::art {
  namespace {
    auto ScaledDimensions(const u32 width, const u32 height, const u32 maxSize) -> std::pair<u32, u32> {
      if (width <= maxSize && height <= maxSize)
        return { width, height };

      const f64 scale = std::min(static_cast<f64>(maxSize) / width, static_cast<f64>(maxSize) / height);
      return {
        std::max<u32>(1, static_cast<u32>(std::lround(width * scale))),
        std::max<u32>(1, static_cast<u32>(std::lround(height * scale))),
      };
    }
  } // namespace
} // namespace mpris_notifier::art

namespace mpris_notifier::art::pixbuf {
  /**
   * @brief RAII wrapper for GError
   */
  class Error {
    GError* m_err = nullptr;

   public:
    Error() = default;

    ~Error() {
      if (m_err)
        g_error_free(m_err);
    }

    Error(const Error&)                    = delete;
    auto operator=(const Error&) -> Error& = delete;
    Error(Error&&)                         = delete;
    auto operator=(Error&&) -> Error&      = delete;

    [[nodiscard]] auto message() const -> const char* {
      return m_err && m_err->message ? m_err->message : "unknown error";
    }

    [[nodiscard]] auto get() -> GError** {
      return &m_err;
    }
  };

  struct ObjectUnref {
    auto operator()(gpointer object) const -> void {
      if (object)
        g_object_unref(object);
    }
  };

  using Pixbuf = std::unique_ptr<GdkPixbuf, ObjectUnref>;

  /**
   * @brief RAII wrapper for GdkPixbufLoader
   * @details The loader is told the target size as soon as the header is
   * parsed, so decoders that can scale while decoding never materialise the
   * full-size image. Headers declaring more than MAX_SOURCE_PIXELS mark the
   * load as refused and the remaining input is never fed to the decoder.
   */
  class Loader {
    struct SizeLimits {
      u32  maxSize  = THUMBNAIL_SIZE;
      u32  width    = 0;
      u32  height   = 0;
      bool oversize = false;
    };

    GdkPixbufLoader* m_loader = gdk_pixbuf_loader_new();
    bool             m_closed = false;
    SizeLimits       m_limits;

    static auto onSizePrepared(GdkPixbufLoader* loader, const gint width, const gint height, gpointer data) -> void {
      auto* limits = static_cast<SizeLimits*>(data);

      limits->width  = static_cast<u32>(std::max(width, 0));
      limits->height = static_cast<u32>(std::max(height, 0));

      if (static_cast<u64>(limits->width) * limits->height > MAX_SOURCE_PIXELS) {
        limits->oversize = true;
        gdk_pixbuf_loader_set_size(loader, 1, 1);
        return;
      }

      if (const auto [scaledWidth, scaledHeight] = ScaledDimensions(limits->width, limits->height, limits->maxSize);
          scaledWidth != limits->width || scaledHeight != limits->height)
        gdk_pixbuf_loader_set_size(loader, static_cast<gint>(scaledWidth), static_cast<gint>(scaledHeight));
    }

    [[nodiscard]] auto checkLimits() const -> Result<> {
      if (m_limits.oversize)
        ERR_FMT(InvalidArgument, "Image of {}x{} pixels exceeds the {} pixel limit", m_limits.width, m_limits.height, MAX_SOURCE_PIXELS);
      return {};
    }

   public:
    explicit Loader(const u32 maxSize) {
      m_limits.maxSize = maxSize;
      g_signal_connect(m_loader, "size-prepared", G_CALLBACK(onSizePrepared), &m_limits);
    }

    ~Loader() {
      // Unreffing an open loader makes gdk-pixbuf complain.
      if (!m_closed)
        gdk_pixbuf_loader_close(m_loader, nullptr);
      g_object_unref(m_loader);
    }

    Loader(const Loader&)                    = delete;
    auto operator=(const Loader&) -> Loader& = delete;
    Loader(Loader&&)                         = delete;
    auto operator=(Loader&&) -> Loader&      = delete;

    // Fed in chunks so an oversized header stops the decode early.
    auto write(std::span<const u8> bytes) -> Result<> {
      constexpr usize CHUNK_SIZE = 64 * 1024;

      while (!bytes.empty()) {
        const std::span<const u8> chunk = bytes.first(std::min(CHUNK_SIZE, bytes.size()));

        Error          err;
        const gboolean written = gdk_pixbuf_loader_write(m_loader, chunk.data(), chunk.size(), err.get());

        TRY_VOID(checkLimits());
        if (!written)
          ERR_FMT(ParseError, "Failed to decode image: {}", err.message());

        bytes = bytes.subspan(chunk.size());
      }

      return {};
    }

    auto close() -> Result<> {
      Error err;
      m_closed = true;
      if (!gdk_pixbuf_loader_close(m_loader, err.get()))
        ERR_FMT(ParseError, "Failed to decode image: {}", err.message());
      return checkLimits();
    }

    // Returns a new reference; the loader keeps its own.
    [[nodiscard]] auto takePixbuf() const -> Pixbuf {
      GdkPixbuf* image = gdk_pixbuf_loader_get_pixbuf(m_loader);
      if (image)
        g_object_ref(image);
      return Pixbuf(image);
    }
  };
} // namespace mpris_notifier::art::pixbuf

namespace mpris_notifier::art {
  namespace {
    enum class UriKind : u8 {
      LocalFile,
      Remote,
      Unsupported,
    };

    auto ReadLocalFile(const fs::path& path) -> Result<Vec<u8>> {
      std::error_code errc;

      const std::uintmax_t size = fs::file_size(path, errc);
      if (errc)
        ERR_FMT(NotFound, "Cannot read '{}': {}", path.string(), errc.message());
      if (size > ART_SIZE_LIMIT)
        ERR_FMT(InvalidArgument, "'{}' is larger than {} bytes", path.string(), ART_SIZE_LIMIT);

      std::ifstream file(path, std::ios::binary);
      if (!file)
        ERR_FMT(NotFound, "Cannot open '{}'", path.string());

      Vec<u8> bytes;
      bytes.reserve(static_cast<usize>(size));
      bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());

      // The file may have grown since it was measured.
      if (bytes.size() > ART_SIZE_LIMIT)
        ERR_FMT(InvalidArgument, "'{}' is larger than {} bytes", path.string(), ART_SIZE_LIMIT);

      return bytes;
    }

    auto Download(const String& url, const std::chrono::milliseconds timeout) -> Result<Vec<u8>> {
      Vec<u8> responseBuffer;

      curl::Easy curlHandle({
        .url              = url,
        .writeBuffer      = &responseBuffer,
        .timeoutMs        = timeout.count(),
        .connectTimeoutMs = timeout.count(),
        .userAgent        = std::format("mpris-notifier/{}", MPRIS_NOTIFIER_VERSION),
      });

      if (!curlHandle) {
        if (const auto& initError = curlHandle.getInitializationError())
          ERR_FROM(*initError);
        ERR(ApiUnavailable, "Failed to initialize cURL");
      }

      TRY_VOID(curlHandle.perform());

      if (responseBuffer.empty())
        ERR_FMT(ParseError, "Empty response from {}", url);

      return responseBuffer;
    }
  } // namespace

  auto Initialize() -> Result<> {
    if (const CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT); res != CURLE_OK)
      ERR_FMT(ApiUnavailable, "curl_global_init failed: {}", curl_easy_strerror(res));
    return {};
  }

  auto LoadBytes(const String& uri, const std::chrono::milliseconds timeout) -> Result<Vec<u8>> {
    using matchit::match, matchit::is, matchit::or_, matchit::_;

    // Some players publish plain paths instead of file:// URIs.
    if (uri.starts_with('/'))
      return ReadLocalFile(uri);

    const curl::Url url    = TRY(curl::Url::parse(uri));
    const String    scheme = TRY(url.scheme());

    const UriKind kind = match(StringView(scheme))(
      is | StringView("file")                           = UriKind::LocalFile,
      is | or_(StringView("http"), StringView("https")) = UriKind::Remote,
      is | _                                            = UriKind::Unsupported
    );

    if (kind == UriKind::Unsupported)
      ERR_FMT(NotSupported, "Unsupported art URI scheme '{}'", scheme);

    if (kind == UriKind::Remote)
      return Download(uri, timeout);

    const String path = TRY(url.path());
    return ReadLocalFile(path);
  }

  auto DecodeImage(const std::span<const u8> bytes, const u32 maxSize) -> Result<ImageData> {
    if (bytes.empty())
      ERR(InvalidArgument, "No image data");

    pixbuf::Loader loader(maxSize);
    TRY_VOID(loader.write(bytes));
    TRY_VOID(loader.close());

    pixbuf::Pixbuf image = loader.takePixbuf();
    if (!image)
      ERR(ParseError, "Decoder produced no image");

    const auto width  = static_cast<u32>(gdk_pixbuf_get_width(image.get()));
    const auto height = static_cast<u32>(gdk_pixbuf_get_height(image.get()));

    if (const auto [scaledWidth, scaledHeight] = ScaledDimensions(width, height, maxSize); scaledWidth != width || scaledHeight != height) {
      image = pixbuf::Pixbuf(gdk_pixbuf_scale_simple(image.get(), static_cast<i32>(scaledWidth), static_cast<i32>(scaledHeight), GDK_INTERP_BILINEAR));
      if (!image)
        ERR(OutOfMemory, "gdk_pixbuf_scale_simple failed");
    }

    if (gdk_pixbuf_get_colorspace(image.get()) != GDK_COLORSPACE_RGB || gdk_pixbuf_get_bits_per_sample(image.get()) != 8)
      ERR(NotSupported, "Only 8-bit RGB images are supported");

    const i32 channels = gdk_pixbuf_get_n_channels(image.get());
    if (channels != 3 && channels != 4)
      ERR_FMT(NotSupported, "Unexpected channel count {}", channels);

    ImageData data;
    data.width         = static_cast<u32>(gdk_pixbuf_get_width(image.get()));
    data.height        = static_cast<u32>(gdk_pixbuf_get_height(image.get()));
    data.hasAlpha      = gdk_pixbuf_get_has_alpha(image.get()) != FALSE;
    data.bitsPerSample = 8;
    data.channels      = static_cast<u32>(channels);
    data.rowstride     = data.width * data.channels;

    // gdk-pixbuf pads rows (and may leave the last row unpadded); repack tightly.
    const usize   sourceStride = static_cast<usize>(gdk_pixbuf_get_rowstride(image.get()));
    const guint8* source       = gdk_pixbuf_read_pixels(image.get());

    data.pixels.resize(static_cast<usize>(data.rowstride) * data.height);
    for (usize row = 0; row < data.height; ++row)
      std::copy_n(source + (row * sourceStride), data.rowstride, data.pixels.begin() + static_cast<std::ptrdiff_t>(row * data.rowstride));

    return data;
  }

  auto FetchBlocking(const String& uri, const std::chrono::milliseconds timeout) -> Result<ImageData> {
    const Vec<u8> bytes = TRY(LoadBytes(uri, timeout));
    return DecodeImage(bytes);
  }

  auto ArtFetcher::fetch(const String& uri, const std::chrono::milliseconds deadline) -> Option<ImageData> {
    return RunWithDeadline([uri, deadline]() -> Result<ImageData> { return FetchBlocking(uri, deadline); }, deadline);
  }
} // namespace mpris_notifier::art
