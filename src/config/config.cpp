/**
 * @file config.cpp
 * @brief Runtime configuration for mpris-notifier
 *
 * @details Configuration is read from a TOML file:
 * - `$XDG_CONFIG_HOME/mpris-notifier/config.toml`, or
 * - `~/.config/mpris-notifier/config.toml` when XDG_CONFIG_HOME is unset.
 *
 * When the file does not exist, a commented default file is written and the
 * built-in defaults are used.
 */

#include "config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <glaze/glaze.hpp>
#include <glaze/toml.hpp>

#include <Drac++/Utils/Error.hpp>
#include <Drac++/Utils/Logging.hpp>
#include <Drac++/Utils/Types.hpp>

using namespace draconis::utils::types;
using namespace draconis::utils::error;
using namespace draconis::utils::logging;
using enum DracErrorCode;

namespace {
  // Mirror of Configuration with TOML-friendly field types. Keys missing from
  // the file keep these defaults.
  struct TomlConfig {
    String           subjectFormat     = String(mpris_notifier::config::DEFAULT_SUBJECT_FORMAT);
    String           bodyFormat        = String(mpris_notifier::config::DEFAULT_BODY_FORMAT);
    String           joinString        = String(mpris_notifier::config::DEFAULT_JOIN_STRING);
    bool             enableAlbumArt    = mpris_notifier::config::DEFAULT_ENABLE_ALBUM_ART;
    u32              albumArtDeadline  = mpris_notifier::config::DEFAULT_ALBUM_ART_DEADLINE;
    Vec<String>      statusTransitions = { "Paused->Playing", "Stopped->Playing" };
    Vec<Vec<String>> commands;
  };
} // namespace

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<TomlConfig> {
  using T                     = TomlConfig;
  static constexpr auto value = object(
    "subject_format",
    &T::subjectFormat,
    "body_format",
    &T::bodyFormat,
    "join_string",
    &T::joinString,
    "enable_album_art",
    &T::enableAlbumArt,
    "album_art_deadline",
    &T::albumArtDeadline,
    "status_transitions",
    &T::statusTransitions,
    "commands",
    &T::commands
  );
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace mpris_notifier::config {
  namespace {
    constexpr StringView CONFIG_DIR_NAME  = "mpris-notifier";
    constexpr StringView CONFIG_FILE_NAME = "config.toml";

    auto ParseStatusName(const StringView name) -> Option<PlaybackStatus> {
      for (const PlaybackStatus status : { PlaybackStatus::Playing, PlaybackStatus::Paused, PlaybackStatus::Stopped })
        if (name == StatusName(status))
          return status;
      if (name == "Unknown")
        return PlaybackStatus::Unknown;
      return None;
    }

    auto Trim(StringView text) -> StringView {
      while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
      while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.remove_suffix(1);
      return text;
    }

    auto FromToml(const TomlConfig& tomlCfg) -> Configuration {
      Configuration cfg;
      cfg.subjectFormat    = tomlCfg.subjectFormat;
      cfg.bodyFormat       = tomlCfg.bodyFormat;
      cfg.joinString       = tomlCfg.joinString;
      cfg.enableAlbumArt   = tomlCfg.enableAlbumArt;
      cfg.albumArtDeadline = tomlCfg.albumArtDeadline;

      cfg.statusTransitions.clear();
      for (const String& entry : tomlCfg.statusTransitions) {
        Result<StatusTransition> transition = ParseStatusTransition(entry);
        if (!transition) {
          warn_log("Ignoring status transition '{}': {}", entry, transition.error().message);
          continue;
        }
        cfg.statusTransitions.push_back(*transition);
      }

      for (const Vec<String>& command : tomlCfg.commands) {
        if (command.empty() || command.front().empty()) {
          warn_log("Ignoring empty entry in commands");
          continue;
        }
        cfg.commands.push_back(command);
      }

      return cfg;
    }

    auto CreateDefaultConfig(const fs::path& configPath) -> void {
      std::error_code errc;
      fs::create_directories(configPath.parent_path(), errc);
      if (errc) {
        warn_log("Unable to create configuration directory '{}', using defaults: {}", configPath.parent_path().string(), errc.message());
        return;
      }

      std::ofstream file(configPath);
      if (!file) {
        warn_log("Unable to write default configuration file '{}', using defaults", configPath.string());
        return;
      }

      file << R"(# mpris-notifier configuration

# Notification summary and body templates. Available placeholders:
#   {title} / {track}, {artist} / {artists}, {album},
#   {album_artist} / {album_artists}, {track_number}, {status}, {url}
# Use {{ and }} for literal braces. Unknown placeholders are printed as-is.
subject_format = "{track}"
body_format = "{album} - {artist}"

# Separator used when a field has several values (e.g. several artists)
join_string = ", "

# Show the player's cover art in the notification
enable_album_art = true

# Milliseconds to wait for cover art before sending the notification without it
album_art_deadline = 1000

# Playback status changes that produce a notification when the track itself
# has not changed. Use "*" as the first status to match any previous status.
status_transitions = ["Paused->Playing", "Stopped->Playing"]

# Programs to run after each notification, one argument list per program.
# For example, to refresh a waybar module:
#   commands = [["pkill", "-RTMIN+2", "waybar"]]
commands = []
)";
    }
  } // namespace

  auto DefaultStatusTransitions() -> Vec<StatusTransition> {
    return {
      { .from = PlaybackStatus::Paused, .to = PlaybackStatus::Playing, .anyFrom = false },
      { .from = PlaybackStatus::Stopped, .to = PlaybackStatus::Playing, .anyFrom = false },
    };
  }

  auto Configuration::isNotifyWorthy(const PlaybackStatus from, const PlaybackStatus to) const -> bool {
    return std::ranges::any_of(statusTransitions, [from, to](const StatusTransition& transition) -> bool {
      return transition.to == to && (transition.anyFrom || transition.from == from);
    });
  }

  auto ParseStatusTransition(const StringView text) -> Result<StatusTransition> {
    constexpr StringView ARROW = "->";

    const usize arrow = text.find(ARROW);
    if (arrow == StringView::npos)
      ERR_FMT(InvalidArgument, "expected 'From->To', got '{}'", text);

    const StringView fromName = Trim(text.substr(0, arrow));
    const StringView toName   = Trim(text.substr(arrow + ARROW.size()));

    const Option<PlaybackStatus> to = ParseStatusName(toName);
    if (!to)
      ERR_FMT(InvalidArgument, "unknown playback status '{}'", toName);

    if (fromName == "*")
      return StatusTransition { .from = PlaybackStatus::Unknown, .to = *to, .anyFrom = true };

    const Option<PlaybackStatus> from = ParseStatusName(fromName);
    if (!from)
      ERR_FMT(InvalidArgument, "unknown playback status '{}'", fromName);

    return StatusTransition { .from = *from, .to = *to, .anyFrom = false };
  }

  auto DefaultConfigPath() -> Result<fs::path> {
    if (const char* xdgConfig = std::getenv("XDG_CONFIG_HOME"); xdgConfig && *xdgConfig)
      return fs::path(xdgConfig) / CONFIG_DIR_NAME / CONFIG_FILE_NAME;

    if (const char* home = std::getenv("HOME"); home && *home)
      return fs::path(home) / ".config" / CONFIG_DIR_NAME / CONFIG_FILE_NAME;

    ERR(NotFound, "Neither XDG_CONFIG_HOME nor HOME is set");
  }

  auto LoadConfig(const fs::path& path) -> Result<Configuration> {
    if (!fs::exists(path)) {
      debug_log("No configuration at {}, writing defaults", path.string());
      CreateDefaultConfig(path);
      return Configuration {};
    }

    TomlConfig tomlCfg;
    String     buffer;

    glz::context ctx {};
    ctx.current_file = path.string();
    if (const auto fileError = glz::file_to_buffer(buffer, ctx.current_file); bool(fileError))
      ERR_FMT(NotFound, "Failed to read configuration file {}", path.string());

    if (const auto readError = glz::read<glz::opts { .format = glz::TOML, .error_on_unknown_keys = false }>(tomlCfg, buffer, ctx))
      ERR_FMT(ParseError, "Failed to parse {}: {}", path.string(), glz::format_error(readError, buffer));

    debug_log("Configuration loaded from {}", path.string());
    return FromToml(tomlCfg);
  }
} // namespace mpris_notifier::config
