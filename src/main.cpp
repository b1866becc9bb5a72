/**
 * @file main.cpp
 * @brief mpris-notifier entry point
 *
 * @details Loads the configuration, connects to the session bus and feeds
 * every relevant signal to the dispatcher until the bus goes away.
 */

#include <chrono>

#include <Drac++/Utils/Error.hpp>
#include <Drac++/Utils/Logging.hpp>
#include <Drac++/Utils/Types.hpp>

#include "art/art.hpp"
#include "commands/commands.hpp"
#include "config/config.hpp"
#include "dbus/dbus.hpp"
#include "dispatcher/dispatcher.hpp"

using namespace draconis::utils::types;
using namespace draconis::utils::error;
using namespace draconis::utils::logging;

namespace {
  constexpr std::chrono::milliseconds POLL_INTERVAL { 250 };

  auto Run() -> Result<> {
    using namespace mpris_notifier;

    const config::fs::path      configPath    = TRY(config::DefaultConfigPath());
    const config::Configuration configuration = TRY(config::LoadConfig(configPath));

    TRY_VOID(art::Initialize());

    dbus::BusSession bus = TRY(dbus::BusSession::connect());

    art::ArtFetcher        artFetcher;
    commands::SpawnRunner  commandRunner;
    dispatcher::Dispatcher dispatcher(configuration, bus, artFetcher, commandRunner);

    info_log("mpris-notifier {} listening for MPRIS players", MPRIS_NOTIFIER_VERSION);

    while (true) {
      Option<BusEvent> event = TRY(bus.nextEvent(POLL_INTERVAL));
      if (event)
        dispatcher.handleEvent(*event);
    }
  }
} // namespace

auto main() -> i32 {
  if (Result<> result = Run(); !result) {
    error_log("mpris-notifier: {}", result.error().message);
    return 1;
  }

  return 0;
}
