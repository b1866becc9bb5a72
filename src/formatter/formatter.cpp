/**
 * @file formatter.cpp
 * @brief Notification text templates
 */

#include "formatter.hpp"

#include <format>
#include <unordered_map>

namespace mpris_notifier::formatter {
  namespace {
    auto GetFieldNames() -> const std::unordered_map<StringView, Field>& {
      static const std::unordered_map<StringView, Field> MAP = {
        {         "title",        Field::Title },
        {         "track",        Field::Title },
        {        "artist",      Field::Artists },
        {       "artists",      Field::Artists },
        {         "album",        Field::Album },
        {  "album_artist", Field::AlbumArtists },
        { "album_artists", Field::AlbumArtists },
        {  "track_number",  Field::TrackNumber },
        {        "status",       Field::Status },
        {           "url",          Field::Url },
      };
      return MAP;
    }

    auto Join(const Vec<String>& values, const StringView separator) -> String {
      String result;
      for (usize i = 0; i < values.size(); ++i) {
        if (i > 0)
          result += separator;
        result += values[i];
      }
      return result;
    }

    auto FieldValue(const Field field, const TrackMetadata& metadata, const StringView joinString) -> String {
      switch (field) {
        case Field::Title:        return metadata.title.value_or("");
        case Field::Artists:      return Join(metadata.artists, joinString);
        case Field::Album:        return metadata.album.value_or("");
        case Field::AlbumArtists: return Join(metadata.albumArtists, joinString);
        case Field::TrackNumber:  return metadata.trackNumber ? std::format("{}", *metadata.trackNumber) : String {};
        case Field::Status:       return String(StatusName(metadata.playbackStatus));
        case Field::Url:          return metadata.url.value_or("");
      }
      return {};
    }
  } // namespace

  auto Tokenize(const StringView format) -> Vec<Segment> {
    Vec<Segment> segments;
    String       literal;

    const auto flushLiteral = [&segments, &literal]() -> void {
      if (literal.empty())
        return;
      segments.emplace_back(Literal { .text = std::move(literal) });
      literal.clear();
    };

    usize pos = 0;
    while (pos < format.size()) {
      const char chr = format[pos];
      const bool doubled = pos + 1 < format.size() && format[pos + 1] == chr;

      if ((chr == '{' || chr == '}') && doubled) {
        literal += chr;
        pos += 2;
        continue;
      }

      if (chr != '{') {
        literal += chr;
        ++pos;
        continue;
      }

      const usize close = format.find('}', pos + 1);
      if (close == StringView::npos) {
        literal.append(format.substr(pos));
        break;
      }

      const StringView name = format.substr(pos + 1, close - pos - 1);

      // "{a{title}" renders "{a" followed by the title.
      if (name.find('{') != StringView::npos) {
        literal += chr;
        ++pos;
        continue;
      }

      if (const auto iter = GetFieldNames().find(name); iter != GetFieldNames().end()) {
        flushLiteral();
        segments.emplace_back(Placeholder { .field = iter->second });
      } else {
        literal.append(format.substr(pos, close - pos + 1));
      }

      pos = close + 1;
    }

    flushLiteral();
    return segments;
  }

  auto Render(const StringView format, const TrackMetadata& metadata, const StringView joinString) -> String {
    String result;
    result.reserve(format.size());

    for (const Segment& segment : Tokenize(format))
      std::visit(
        [&](const auto& part) -> void {
          using T = std::decay_t<decltype(part)>;
          if constexpr (std::is_same_v<T, Literal>)
            result += part.text;
          else
            result += FieldValue(part.field, metadata, joinString);
        },
        segment
      );

    return result;
  }
} // namespace mpris_notifier::formatter
