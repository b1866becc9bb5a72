/**
 * @file test_helpers.hpp
 * @brief Builders for the loosely-typed property dictionaries players send
 */

#pragma once

#include <initializer_list>

#include "notifier_types.hpp"

namespace mpris_notifier::testing {
  inline auto Str(const char* text) -> BusValue {
    return BusValue { String(text) };
  }

  inline auto Int(const i64 number) -> BusValue {
    return BusValue { number };
  }

  inline auto Strings(std::initializer_list<const char*> values) -> BusValue {
    BusArray array;
    for (const char* value : values)
      array.push_back(Str(value));
    return BusValue { std::move(array) };
  }

  inline auto Dict(BusDict dict) -> BusValue {
    return BusValue { std::move(dict) };
  }

  /**
   * @brief Changed-properties dict carrying Metadata and PlaybackStatus
   */
  inline auto TrackChange(
    const char*                        title,
    std::initializer_list<const char*> artists,
    const char*                        album,
    const char*                        status
  ) -> BusDict {
    return {
      {       "Metadata", Dict({ { "xesam:title", Str(title) }, { "xesam:artist", Strings(artists) }, { "xesam:album", Str(album) } }) },
      { "PlaybackStatus",                                                                                               Str(status) },
    };
  }

  inline auto StatusChange(const char* status) -> BusDict {
    return { { "PlaybackStatus", Str(status) } };
  }
} // namespace mpris_notifier::testing
