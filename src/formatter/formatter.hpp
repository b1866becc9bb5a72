/**
 * @file formatter.hpp
 * @brief Notification text templates
 *
 * @details A template is literal text with `{name}` placeholders. `{{` and
 * `}}` produce literal braces. Placeholders with names that are not listed
 * in Field are kept verbatim, so templates written for a newer version
 * still render something sensible.
 */

#pragma once

#include "../notifier_types.hpp"

namespace mpris_notifier::formatter {
  enum class Field : u8 {
    Title,
    Artists,
    Album,
    AlbumArtists,
    TrackNumber,
    Status,
    Url,
  };

  struct Literal {
    String text;

    auto operator==(const Literal&) const -> bool = default;
  };

  struct Placeholder {
    Field field;

    auto operator==(const Placeholder&) const -> bool = default;
  };

  using Segment = std::variant<Literal, Placeholder>;

  /**
   * @brief Splits a template into literal runs and recognised placeholders
   * @details Adjacent literal text (including unknown placeholders and
   * unescaped braces) is merged into a single Literal.
   */
  auto Tokenize(StringView format) -> Vec<Segment>;

  /**
   * @brief Renders a template against a metadata snapshot
   * @param format Template text
   * @param metadata Track to render
   * @param joinString Separator for multi-valued fields such as artists
   * @return The rendered text; absent fields render as empty
   */
  auto Render(StringView format, const TrackMetadata& metadata, StringView joinString) -> String;
} // namespace mpris_notifier::formatter
