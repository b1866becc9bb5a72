/**
 * @file metadata.hpp
 * @brief Tolerant parsing of MPRIS player properties into TrackMetadata
 */

#pragma once

#include "../notifier_types.hpp"

namespace mpris_notifier::metadata {
  inline constexpr StringView MPRIS_PLAYER_INTERFACE = "org.mpris.MediaPlayer2.Player";

  /**
   * @brief Per-type coercion from a loosely-typed bus value
   * @details Each specialisation returns None when the value cannot be
   * represented as T. Extraction never fails the surrounding record.
   */
  template <typename T>
  struct TryExtract;

  template <>
  struct TryExtract<String> {
    static auto from(const BusValue& value) -> Option<String>;
  };

  template <>
  struct TryExtract<Vec<String>> {
    static auto from(const BusValue& value) -> Option<Vec<String>>;
  };

  template <>
  struct TryExtract<u32> {
    static auto from(const BusValue& value) -> Option<u32>;
  };

  template <>
  struct TryExtract<PlaybackStatus> {
    static auto from(const BusValue& value) -> Option<PlaybackStatus>;
  };

  template <>
  struct TryExtract<BusDict> {
    static auto from(const BusValue& value) -> Option<BusDict>;
  };

  /**
   * @brief Looks up `key` in `dict` and extracts it as T
   */
  template <typename T>
  auto Extract(const BusDict& dict, const String& key) -> Option<T> {
    if (const auto iter = dict.find(key); iter != dict.end())
      return TryExtract<T>::from(iter->second);
    return None;
  }

  /**
   * @brief Which of the interesting properties a PropertiesChanged signal carried
   */
  struct PropertyChange {
    Option<TrackMetadata>  metadata;
    Option<PlaybackStatus> status;
  };

  /**
   * @brief Builds a TrackMetadata from the changed-properties dictionary
   * @details Missing or mistyped fields become absent; status defaults to Unknown.
   */
  auto Parse(const BusDict& rawProperties) -> TrackMetadata;

  /**
   * @brief Like Parse, but reports whether `Metadata` and `PlaybackStatus` were present at all
   */
  auto ParseChange(const BusDict& rawProperties) -> PropertyChange;

  auto IdentityOf(const TrackMetadata& metadata) -> TrackIdentity;

  auto StatusFromString(StringView status) -> PlaybackStatus;
} // namespace mpris_notifier::metadata
