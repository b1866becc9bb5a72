/**
 * @file metadata.cpp
 * @brief Tolerant parsing of MPRIS player properties
 *
 * @details Players vary a lot in how strictly they follow the MPRIS
 * metadata conventions: some send `xesam:artist` as a plain string, some send
 * track numbers as strings or doubles, some send empty strings for unset
 * fields. Every field is coerced on its own so one bad value never discards
 * the rest of the record.
 */

#include "metadata.hpp"

#include <cmath>
#include <format>
#include <limits>
#include <matchit.hpp>

namespace mpris_notifier::metadata {
  namespace {
    constexpr u64 MAX_U32 = std::numeric_limits<u32>::max();

    // Scalar to string for array elements. Containers are not coerced.
    auto CoerceToString(const BusValue& value) -> Option<String> {
      return std::visit(
        [](const auto& inner) -> Option<String> {
          using T = std::decay_t<decltype(inner)>;
          if constexpr (std::is_same_v<T, String>)
            return inner.empty() ? None : Some(inner);
          else if constexpr (std::is_same_v<T, bool>)
            return String(inner ? "true" : "false");
          else if constexpr (std::is_same_v<T, i64> || std::is_same_v<T, u64>)
            return std::format("{}", inner);
          else if constexpr (std::is_same_v<T, f64>)
            return std::isfinite(inner) ? Some(std::format("{}", inner)) : None;
          else
            return None;
        },
        value.data
      );
    }

    auto MetadataFromDict(const BusDict& dict) -> TrackMetadata {
      TrackMetadata data;

      data.title        = Extract<String>(dict, "xesam:title");
      data.artists      = Extract<Vec<String>>(dict, "xesam:artist").value_or(Vec<String> {});
      data.album        = Extract<String>(dict, "xesam:album");
      data.artUri       = Extract<String>(dict, "mpris:artUrl");
      data.albumArtists = Extract<Vec<String>>(dict, "xesam:albumArtist").value_or(Vec<String> {});
      data.trackNumber  = Extract<u32>(dict, "xesam:trackNumber");
      data.trackId      = Extract<String>(dict, "mpris:trackid");
      data.url          = Extract<String>(dict, "xesam:url");

      return data;
    }
  } // namespace

  auto TryExtract<String>::from(const BusValue& value) -> Option<String> {
    if (const auto* str = std::get_if<String>(&value.data); str && !str->empty())
      return *str;
    return None;
  }

  auto TryExtract<Vec<String>>::from(const BusValue& value) -> Option<Vec<String>> {
    if (const auto* str = std::get_if<String>(&value.data))
      return str->empty() ? Vec<String> {} : Vec<String> { *str };

    const auto* array = std::get_if<BusArray>(&value.data);
    if (!array)
      return None;

    Vec<String> result;
    result.reserve(array->size());

    for (const BusValue& element : *array)
      if (Option<String> entry = CoerceToString(element))
        result.push_back(std::move(*entry));

    return result;
  }

  auto TryExtract<u32>::from(const BusValue& value) -> Option<u32> {
    return std::visit(
      [](const auto& inner) -> Option<u32> {
        using T = std::decay_t<decltype(inner)>;
        if constexpr (std::is_same_v<T, i64>)
          return inner >= 0 && static_cast<u64>(inner) <= MAX_U32 ? Some(static_cast<u32>(inner)) : None;
        else if constexpr (std::is_same_v<T, u64>)
          return inner <= MAX_U32 ? Some(static_cast<u32>(inner)) : None;
        else if constexpr (std::is_same_v<T, f64>)
          return std::isfinite(inner) && inner >= 0.0 && inner <= static_cast<f64>(MAX_U32) ? Some(static_cast<u32>(inner)) : None;
        else if constexpr (std::is_same_v<T, String>) {
          u32 number = 0;
          if (inner.empty())
            return None;
          for (const char chr : inner) {
            if (chr < '0' || chr > '9')
              return None;
            const u64 next = (static_cast<u64>(number) * 10) + static_cast<u64>(chr - '0');
            if (next > MAX_U32)
              return None;
            number = static_cast<u32>(next);
          }
          return number;
        } else
          return None;
      },
      value.data
    );
  }

  auto TryExtract<PlaybackStatus>::from(const BusValue& value) -> Option<PlaybackStatus> {
    if (const auto* str = std::get_if<String>(&value.data))
      return StatusFromString(*str);
    return None;
  }

  auto TryExtract<BusDict>::from(const BusValue& value) -> Option<BusDict> {
    if (const auto* dict = std::get_if<BusDict>(&value.data))
      return *dict;
    return None;
  }

  auto StatusFromString(const StringView status) -> PlaybackStatus {
    using matchit::match, matchit::is, matchit::_;

    return match(status)(
      is | StringView("Playing") = PlaybackStatus::Playing,
      is | StringView("Paused")  = PlaybackStatus::Paused,
      is | StringView("Stopped") = PlaybackStatus::Stopped,
      is | _                     = PlaybackStatus::Unknown
    );
  }

  auto Parse(const BusDict& rawProperties) -> TrackMetadata {
    PropertyChange change = ParseChange(rawProperties);

    TrackMetadata data  = change.metadata ? std::move(*change.metadata) : TrackMetadata {};
    data.playbackStatus = change.status.value_or(PlaybackStatus::Unknown);
    return data;
  }

  auto ParseChange(const BusDict& rawProperties) -> PropertyChange {
    PropertyChange change;

    // A `Metadata` entry that is not a dictionary is treated as not sent,
    // rather than as a track with every field cleared.
    if (const Option<BusDict> dict = Extract<BusDict>(rawProperties, "Metadata"))
      change.metadata = MetadataFromDict(*dict);

    change.status = Extract<PlaybackStatus>(rawProperties, "PlaybackStatus");

    if (change.metadata && change.status)
      change.metadata->playbackStatus = *change.status;

    return change;
  }

  auto IdentityOf(const TrackMetadata& metadata) -> TrackIdentity {
    return TrackIdentity {
      .title   = metadata.title,
      .artists = metadata.artists,
      .album   = metadata.album,
    };
  }
} // namespace mpris_notifier::metadata
