/**
 * @file config.hpp
 * @brief Runtime configuration for mpris-notifier
 */

#pragma once

#include <chrono>
#include <filesystem>

#include <Drac++/Utils/Error.hpp>

#include "../notifier_types.hpp"

namespace mpris_notifier::config {
  namespace fs = std::filesystem;

  inline constexpr StringView DEFAULT_SUBJECT_FORMAT     = "{track}";
  inline constexpr StringView DEFAULT_BODY_FORMAT        = "{album} - {artist}";
  inline constexpr StringView DEFAULT_JOIN_STRING        = ", ";
  inline constexpr bool       DEFAULT_ENABLE_ALBUM_ART   = true;
  inline constexpr u32        DEFAULT_ALBUM_ART_DEADLINE = 1000;

  auto DefaultStatusTransitions() -> Vec<StatusTransition>;

  /**
   * @brief Immutable configuration handed to the dispatcher at startup
   */
  struct Configuration {
    /// Template for the notification summary.
    String subjectFormat = String(DEFAULT_SUBJECT_FORMAT);

    /// Template for the notification body.
    String bodyFormat = String(DEFAULT_BODY_FORMAT);

    /// Separator for multi-valued fields such as artists.
    String joinString = String(DEFAULT_JOIN_STRING);

    /// Attach cover art when the player publishes `mpris:artUrl`.
    bool enableAlbumArt = DEFAULT_ENABLE_ALBUM_ART;

    /// Milliseconds the art fetch may take before the notification is sent without it.
    u32 albumArtDeadline = DEFAULT_ALBUM_ART_DEADLINE;

    /// Status changes that notify when the track itself did not change.
    Vec<StatusTransition> statusTransitions = DefaultStatusTransitions();

    /// Programs started after each notification, as argument vectors.
    Vec<Vec<String>> commands;

    [[nodiscard]] auto albumArtTimeout() const -> std::chrono::milliseconds {
      return std::chrono::milliseconds(albumArtDeadline);
    }

    [[nodiscard]] auto isNotifyWorthy(PlaybackStatus from, PlaybackStatus to) const -> bool;
  };

  /**
   * @brief Parses a transition such as "Paused->Playing" or "*->Playing"
   */
  auto ParseStatusTransition(StringView text) -> Result<StatusTransition>;

  /**
   * @brief `$XDG_CONFIG_HOME/mpris-notifier/config.toml`, or `~/.config/...` when unset
   */
  auto DefaultConfigPath() -> Result<fs::path>;

  /**
   * @brief Loads the configuration file at `path`
   * @details A missing file is replaced with a commented default one and the
   * defaults are returned. A file that fails to parse is an error.
   */
  auto LoadConfig(const fs::path& path) -> Result<Configuration>;
} // namespace mpris_notifier::config
