/**
 * @file dispatcher.hpp
 * @brief Change detection and notification dispatch
 *
 * @details The dispatcher keeps one SourceState per player (keyed by its
 * unique bus name) and decides, for each PropertiesChanged signal, whether
 * the player moved to a new track, changed status in a way the
 * configuration cares about, or only repeated itself.
 *
 * All state lives here and is only touched from the dispatch loop.
 */

#pragma once

#include <unordered_map>

#include <Drac++/Utils/Error.hpp>

#include "../art/art.hpp"
#include "../commands/commands.hpp"
#include "../config/config.hpp"
#include "../notifier_types.hpp"

namespace mpris_notifier::dispatcher {
  /**
   * @brief Outbound side of the bus: delivers a rendered notification
   */
  class INotificationSink {
   public:
    INotificationSink()                                            = default;
    virtual ~INotificationSink()                                   = default;
    INotificationSink(const INotificationSink&)                    = delete;
    auto operator=(const INotificationSink&) -> INotificationSink& = delete;
    INotificationSink(INotificationSink&&)                         = default;
    auto operator=(INotificationSink&&) -> INotificationSink&      = default;

    /**
     * @brief Sends a notification without waiting for the daemon
     * @return An identifier for the request, or an error if it could not be sent
     */
    virtual auto sendNotification(const RenderedNotification& notification) -> Result<u32> = 0;
  };

  struct SourceState {
    String                sourceId;
    Option<TrackIdentity> lastIdentity;
    PlaybackStatus        lastStatus = PlaybackStatus::Unknown;
    Option<TrackMetadata> lastMetadata;
  };

  class Dispatcher {
    config::Configuration                   m_config;
    INotificationSink&                      m_sink;
    art::IArtFetcher&                       m_artFetcher;
    commands::ICommandRunner&               m_commandRunner;
    std::unordered_map<String, SourceState> m_sources;

    auto dispatch(const TrackMetadata& metadata) -> void;
    auto runCommands() -> void;

   public:
    Dispatcher(config::Configuration configuration, INotificationSink& sink, art::IArtFetcher& artFetcher, commands::ICommandRunner& commandRunner);

    auto handleEvent(const BusEvent& event) -> void;

    /**
     * @brief Processes one PropertiesChanged signal
     * @return Whether a notification was emitted
     */
    auto onPropertiesChanged(const String& sourceId, const BusDict& properties) -> bool;

    auto onPeerRemoved(const String& sourceId) -> void;

    [[nodiscard]] auto findSource(const String& sourceId) const -> const SourceState*;

    [[nodiscard]] auto sourceCount() const -> usize {
      return m_sources.size();
    }
  };
} // namespace mpris_notifier::dispatcher
