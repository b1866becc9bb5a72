/**
 * @file dispatcher.cpp
 * @brief Change detection and notification dispatch
 */

#include "dispatcher.hpp"

#include <utility>

#include <Drac++/Utils/Logging.hpp>

#include "../formatter/formatter.hpp"
#include "../metadata/metadata.hpp"

namespace mpris_notifier::dispatcher {
  Dispatcher::Dispatcher(config::Configuration configuration, INotificationSink& sink, art::IArtFetcher& artFetcher, commands::ICommandRunner& commandRunner)
    : m_config(std::move(configuration)), m_sink(sink), m_artFetcher(artFetcher), m_commandRunner(commandRunner) {}

  auto Dispatcher::handleEvent(const BusEvent& event) -> void {
    std::visit(
      [this](const auto& inner) -> void {
        using T = std::decay_t<decltype(inner)>;
        if constexpr (std::is_same_v<T, PropertiesChangedEvent>)
          onPropertiesChanged(inner.sourceId, inner.properties);
        else
          onPeerRemoved(inner.sourceId);
      },
      event
    );
  }

  auto Dispatcher::onPropertiesChanged(const String& sourceId, const BusDict& properties) -> bool {
    const metadata::PropertyChange change = metadata::ParseChange(properties);

    auto [iter, inserted] = m_sources.try_emplace(sourceId, SourceState { .sourceId = sourceId });
    SourceState& state    = iter->second;

    if (inserted)
      debug_log("Tracking new player {}", sourceId);

    // Volume, position, shuffle and the like.
    if (!change.metadata && !change.status)
      return false;

    TrackMetadata current;
    if (change.metadata)
      current = *change.metadata;
    else if (state.lastMetadata)
      current = *state.lastMetadata;
    current.playbackStatus = change.status.value_or(state.lastStatus);

    const PlaybackStatus previousStatus = std::exchange(state.lastStatus, current.playbackStatus);
    const TrackIdentity  identity       = metadata::IdentityOf(current);

    if (identity.isEmpty()) {
      debug_log("Ignoring update without title, artist or album from {}", sourceId);
      return false;
    }

    const bool firstTrack   = !state.lastIdentity;
    const bool trackChanged = firstTrack || *state.lastIdentity != identity;

    state.lastIdentity = identity;
    state.lastMetadata = current;

    if (firstTrack) {
      if (current.playbackStatus == PlaybackStatus::Stopped) {
        debug_log("First track from {} is stopped, not notifying", sourceId);
        return false;
      }
    } else if (!trackChanged) {
      if (previousStatus == current.playbackStatus || !m_config.isNotifyWorthy(previousStatus, current.playbackStatus)) {
        debug_log("Suppressing duplicate update from {}", sourceId);
        return false;
      }
    }

    dispatch(current);
    return true;
  }

  auto Dispatcher::onPeerRemoved(const String& sourceId) -> void {
    if (m_sources.erase(sourceId) > 0)
      debug_log("Player {} left the bus", sourceId);
  }

  auto Dispatcher::findSource(const String& sourceId) const -> const SourceState* {
    const auto iter = m_sources.find(sourceId);
    return iter == m_sources.end() ? nullptr : &iter->second;
  }

  auto Dispatcher::dispatch(const TrackMetadata& metadata) -> void {
    RenderedNotification notification {
      .subject = formatter::Render(m_config.subjectFormat, metadata, m_config.joinString),
      .body    = formatter::Render(m_config.bodyFormat, metadata, m_config.joinString),
      .icon    = None,
    };

    if (m_config.enableAlbumArt && metadata.artUri)
      notification.icon = m_artFetcher.fetch(*metadata.artUri, m_config.albumArtTimeout());

    const Result<u32> sent = m_sink.sendNotification(notification);
    if (!sent) {
      warn_log("Failed to send notification '{}': {}", notification.subject, sent.error().message);
      return;
    }

    info_log("Notified '{}' (request {})", notification.subject, *sent);
    runCommands();
  }

  auto Dispatcher::runCommands() -> void {
    for (const Vec<String>& command : m_config.commands)
      if (Result<> started = m_commandRunner.run(command); !started)
        warn_log("Command failed: {}", started.error().message);
  }
} // namespace mpris_notifier::dispatcher
