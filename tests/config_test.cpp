#include "config/config.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <random>

#include "catch2/catch.hpp"

namespace mpris_notifier::config {
  namespace {
    class TempDir {
      fs::path m_path;

     public:
      TempDir() {
        std::random_device device;
        m_path = fs::temp_directory_path() / std::format("mpris-notifier-test-{:x}", device());
        fs::create_directories(m_path);
      }

      ~TempDir() {
        std::error_code errc;
        fs::remove_all(m_path, errc);
      }

      TempDir(const TempDir&)                    = delete;
      auto operator=(const TempDir&) -> TempDir& = delete;
      TempDir(TempDir&&)                         = delete;
      auto operator=(TempDir&&) -> TempDir&      = delete;

      [[nodiscard]] auto path() const -> const fs::path& {
        return m_path;
      }
    };

    auto WriteFile(const fs::path& path, const StringView contents) -> void {
      std::ofstream file(path);
      file << contents;
    }
  } // namespace

  TEST_CASE("status transition parsing", "[unit]") {
    SECTION("plain transition") {
      const Result<StatusTransition> transition = ParseStatusTransition("Paused->Playing");
      REQUIRE(transition);
      REQUIRE(*transition == StatusTransition { .from = PlaybackStatus::Paused, .to = PlaybackStatus::Playing, .anyFrom = false });
    }

    SECTION("whitespace around the arrow") {
      const Result<StatusTransition> transition = ParseStatusTransition(" Playing -> Paused ");
      REQUIRE(transition);
      REQUIRE(transition->from == PlaybackStatus::Playing);
      REQUIRE(transition->to == PlaybackStatus::Paused);
    }

    SECTION("wildcard source") {
      const Result<StatusTransition> transition = ParseStatusTransition("*->Stopped");
      REQUIRE(transition);
      REQUIRE(transition->anyFrom);
      REQUIRE(transition->to == PlaybackStatus::Stopped);
    }

    SECTION("invalid entries") {
      REQUIRE_FALSE(ParseStatusTransition("Paused"));
      REQUIRE_FALSE(ParseStatusTransition("Paused->Rewinding"));
      REQUIRE_FALSE(ParseStatusTransition("Rewinding->Playing"));
      REQUIRE_FALSE(ParseStatusTransition("Paused->*"));
    }
  }

  TEST_CASE("default notify-worthy transitions", "[unit]") {
    const Configuration cfg;

    REQUIRE(cfg.isNotifyWorthy(PlaybackStatus::Paused, PlaybackStatus::Playing));
    REQUIRE(cfg.isNotifyWorthy(PlaybackStatus::Stopped, PlaybackStatus::Playing));
    REQUIRE_FALSE(cfg.isNotifyWorthy(PlaybackStatus::Playing, PlaybackStatus::Paused));
    REQUIRE_FALSE(cfg.isNotifyWorthy(PlaybackStatus::Playing, PlaybackStatus::Stopped));
    REQUIRE_FALSE(cfg.isNotifyWorthy(PlaybackStatus::Unknown, PlaybackStatus::Playing));
  }

  TEST_CASE("configuration file loading", "[unit]") {
    const TempDir  dir;
    const fs::path path = dir.path() / "mpris-notifier" / "config.toml";

    SECTION("missing file yields defaults and writes a default file") {
      const Result<Configuration> cfg = LoadConfig(path);
      REQUIRE(cfg);
      REQUIRE(cfg->subjectFormat == DEFAULT_SUBJECT_FORMAT);
      REQUIRE(cfg->bodyFormat == DEFAULT_BODY_FORMAT);
      REQUIRE(cfg->joinString == DEFAULT_JOIN_STRING);
      REQUIRE(cfg->enableAlbumArt);
      REQUIRE(cfg->albumArtDeadline == DEFAULT_ALBUM_ART_DEADLINE);
      REQUIRE(cfg->statusTransitions == DefaultStatusTransitions());
      REQUIRE(cfg->commands.empty());
      REQUIRE(fs::exists(path));

      const Result<Configuration> reloaded = LoadConfig(path);
      REQUIRE(reloaded);
      REQUIRE(reloaded->subjectFormat == DEFAULT_SUBJECT_FORMAT);
      REQUIRE(reloaded->statusTransitions == DefaultStatusTransitions());
    }

    SECTION("values from the file override the defaults") {
      fs::create_directories(path.parent_path());
      WriteFile(
        path,
        "subject_format = \"{artist}: {title}\"\n"
        "join_string = \" / \"\n"
        "enable_album_art = false\n"
        "album_art_deadline = 250\n"
        "status_transitions = [\"*->Playing\", \"Playing->Paused\"]\n"
      );

      const Result<Configuration> cfg = LoadConfig(path);
      REQUIRE(cfg);
      REQUIRE(cfg->subjectFormat == "{artist}: {title}");
      REQUIRE(cfg->bodyFormat == DEFAULT_BODY_FORMAT);
      REQUIRE(cfg->joinString == " / ");
      REQUIRE_FALSE(cfg->enableAlbumArt);
      REQUIRE(cfg->albumArtTimeout() == std::chrono::milliseconds(250));
      REQUIRE(cfg->isNotifyWorthy(PlaybackStatus::Unknown, PlaybackStatus::Playing));
      REQUIRE(cfg->isNotifyWorthy(PlaybackStatus::Playing, PlaybackStatus::Paused));
      REQUIRE_FALSE(cfg->isNotifyWorthy(PlaybackStatus::Playing, PlaybackStatus::Stopped));
    }

    SECTION("commands are argument lists") {
      fs::create_directories(path.parent_path());
      WriteFile(path, "commands = [[\"pkill\", \"-RTMIN+2\", \"waybar\"], [\"notify-hook\"], []]\n");

      const Result<Configuration> cfg = LoadConfig(path);
      REQUIRE(cfg);
      REQUIRE(cfg->commands.size() == 2);
      REQUIRE(cfg->commands[0] == Vec<String> { "pkill", "-RTMIN+2", "waybar" });
      REQUIRE(cfg->commands[1] == Vec<String> { "notify-hook" });
    }

    SECTION("a command that is not a list of strings is an error") {
      fs::create_directories(path.parent_path());
      WriteFile(path, "commands = [\"pkill -RTMIN+2 waybar\"]\n");

      REQUIRE_FALSE(LoadConfig(path));
    }

    SECTION("invalid transitions are skipped") {
      fs::create_directories(path.parent_path());
      WriteFile(path, "status_transitions = [\"Paused->Playing\", \"sideways\"]\n");

      const Result<Configuration> cfg = LoadConfig(path);
      REQUIRE(cfg);
      REQUIRE(cfg->statusTransitions.size() == 1);
    }

    SECTION("a file that does not parse is an error") {
      fs::create_directories(path.parent_path());
      WriteFile(path, "enable_album_art = \"sometimes\"\n");

      const Result<Configuration> cfg = LoadConfig(path);
      REQUIRE_FALSE(cfg);
      REQUIRE(cfg.error().code == draconis::utils::error::DracErrorCode::ParseError);
    }
  }

  TEST_CASE("configuration path follows XDG_CONFIG_HOME", "[unit]") {
    const char*          previous = std::getenv("XDG_CONFIG_HOME");
    const Option<String> saved    = previous ? Some(String(previous)) : None;

    setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    const Result<fs::path> path = DefaultConfigPath();

    if (saved)
      setenv("XDG_CONFIG_HOME", saved->c_str(), 1);
    else
      unsetenv("XDG_CONFIG_HOME");

    REQUIRE(path);
    REQUIRE(path->string() == "/tmp/xdg-test/mpris-notifier/config.toml");
  }
} // namespace mpris_notifier::config
