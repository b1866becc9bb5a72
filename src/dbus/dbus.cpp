/**
 * @file dbus.cpp
 * @brief Session-bus I/O: signal decoding and Notify marshalling
 */

#include "dbus.hpp"

#include <format>

#include <Drac++/Utils/Logging.hpp>

#include "../metadata/metadata.hpp"

using namespace draconis::utils::logging;

namespace mpris_notifier::dbus {
  namespace {
    constexpr const char* PROPERTIES_INTERFACE = "org.freedesktop.DBus.Properties";
    constexpr const char* BUS_INTERFACE        = "org.freedesktop.DBus";
    constexpr const char* LOCAL_INTERFACE      = "org.freedesktop.DBus.Local";

    constexpr const char* PROPERTIES_CHANGED_RULE =
      "type='signal',interface='org.freedesktop.DBus.Properties',member='PropertiesChanged',path='/org/mpris/MediaPlayer2'";
    constexpr const char* NAME_OWNER_CHANGED_RULE =
      "type='signal',sender='org.freedesktop.DBus',interface='org.freedesktop.DBus',member='NameOwnerChanged'";

    constexpr const char* HINT_SYNCHRONOUS = "x-canonical-private-synchronous";
    constexpr const char* HINT_IMAGE_DATA  = "image-data";

    // Replies we never saw are dropped past this size so a silent daemon cannot grow the set.
    constexpr usize MAX_PENDING_NOTIFICATIONS = 256;

    auto DecodePropertiesChanged(const Message& message) -> Option<BusEvent> {
      if (message.path() != MPRIS_OBJECT_PATH)
        return None;

      Option<String> sender = message.sender();
      if (!sender)
        return None;

      MessageIter iter = message.iterInit();
      if (iter.getString() != metadata::MPRIS_PLAYER_INTERFACE)
        return None;

      if (!iter.next() || iter.getArgType() != DBUS_TYPE_ARRAY || iter.getElementType() != DBUS_TYPE_DICT_ENTRY)
        return None;

      BusValue changed = iter.readValue();
      auto*    dict    = std::get_if<BusDict>(&changed.data);
      if (!dict)
        return None;

      return PropertiesChangedEvent { .sourceId = std::move(*sender), .properties = std::move(*dict) };
    }

    auto DecodeNameOwnerChanged(const Message& message) -> Option<BusEvent> {
      MessageIter iter = message.iterInit();

      Option<String> name     = iter.getString();
      Option<String> oldOwner = iter.next() ? iter.getString() : None;
      Option<String> newOwner = iter.next() ? iter.getString() : None;

      if (!name || (newOwner && !newOwner->empty()))
        return None;

      if (name->starts_with(':'))
        return PeerRemovedEvent { .sourceId = std::move(*name) };

      if (name->starts_with(MPRIS_NAME_PREFIX) && oldOwner && !oldOwner->empty())
        return PeerRemovedEvent { .sourceId = std::move(*oldOwner) };

      return None;
    }

    auto AppendImage(DBusMessageIter* variant, const ImageData& image) -> bool {
      DBusMessageIter structIter;
      if (!dbus_message_iter_open_container(variant, DBUS_TYPE_STRUCT, nullptr, &structIter))
        return false;

      const dbus_int32_t width         = static_cast<dbus_int32_t>(image.width);
      const dbus_int32_t height        = static_cast<dbus_int32_t>(image.height);
      const dbus_int32_t rowstride     = static_cast<dbus_int32_t>(image.rowstride);
      const dbus_bool_t  hasAlpha      = image.hasAlpha ? TRUE : FALSE;
      const dbus_int32_t bitsPerSample = static_cast<dbus_int32_t>(image.bitsPerSample);
      const dbus_int32_t channels      = static_cast<dbus_int32_t>(image.channels);

      bool success = dbus_message_iter_append_basic(&structIter, DBUS_TYPE_INT32, &width) &&
        dbus_message_iter_append_basic(&structIter, DBUS_TYPE_INT32, &height) &&
        dbus_message_iter_append_basic(&structIter, DBUS_TYPE_INT32, &rowstride) &&
        dbus_message_iter_append_basic(&structIter, DBUS_TYPE_BOOLEAN, &hasAlpha) &&
        dbus_message_iter_append_basic(&structIter, DBUS_TYPE_INT32, &bitsPerSample) &&
        dbus_message_iter_append_basic(&structIter, DBUS_TYPE_INT32, &channels);

      DBusMessageIter bytes;
      if (success && dbus_message_iter_open_container(&structIter, DBUS_TYPE_ARRAY, DBUS_TYPE_BYTE_AS_STRING, &bytes)) {
        const u8* data = image.pixels.data();
        success        = dbus_message_iter_append_fixed_array(&bytes, DBUS_TYPE_BYTE, &data, static_cast<int>(image.pixels.size()));
        success        = dbus_message_iter_close_container(&structIter, &bytes) && success;
      } else {
        success = false;
      }

      if (!success) {
        dbus_message_iter_abandon_container(variant, &structIter);
        return false;
      }

      return dbus_message_iter_close_container(variant, &structIter);
    }

    template <typename ValueWriter>
    auto AppendHint(DBusMessageIter* hints, const char* key, const char* signature, ValueWriter&& writeValue) -> bool {
      DBusMessageIter entry;
      DBusMessageIter variant;

      if (!dbus_message_iter_open_container(hints, DBUS_TYPE_DICT_ENTRY, nullptr, &entry))
        return false;

      if (!dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, static_cast<const RawPointer>(&key)) ||
          !dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, signature, &variant)) {
        dbus_message_iter_abandon_container(hints, &entry);
        return false;
      }

      if (!writeValue(&variant)) {
        dbus_message_iter_abandon_container(&entry, &variant);
        dbus_message_iter_abandon_container(hints, &entry);
        return false;
      }

      return dbus_message_iter_close_container(&entry, &variant) && dbus_message_iter_close_container(hints, &entry);
    }

    // as actions, a{sv} hints
    auto AppendActionsAndHints(DBusMessageIter* iter, const Option<ImageData>& icon) -> bool {
      DBusMessageIter actions;
      if (!dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, DBUS_TYPE_STRING_AS_STRING, &actions) ||
          !dbus_message_iter_close_container(iter, &actions))
        return false;

      DBusMessageIter hints;
      if (!dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}", &hints))
        return false;

      bool success = AppendHint(&hints, HINT_SYNCHRONOUS, DBUS_TYPE_STRING_AS_STRING, [](DBusMessageIter* variant) -> bool {
        const char* value = APP_NAME;
        return dbus_message_iter_append_basic(variant, DBUS_TYPE_STRING, static_cast<const RawPointer>(&value));
      });

      if (success && icon)
        success = AppendHint(&hints, HINT_IMAGE_DATA, "(iiibiiay)", [&icon](DBusMessageIter* variant) -> bool {
          return AppendImage(variant, *icon);
        });

      if (!success) {
        dbus_message_iter_abandon_container(iter, &hints);
        return false;
      }

      return dbus_message_iter_close_container(iter, &hints);
    }
  } // namespace

  auto MessageIter::getString() -> Option<String> {
    const i32 argType = getArgType();
    if (argType != DBUS_TYPE_STRING && argType != DBUS_TYPE_OBJECT_PATH && argType != DBUS_TYPE_SIGNATURE)
      return None;

    const char* strPtr = readBasic<const char*>();
    return String(strPtr ? strPtr : "");
  }

  auto MessageIter::readElements() -> BusArray {
    BusArray    elements;
    MessageIter subIter = recurse();

    while (subIter.getArgType() != DBUS_TYPE_INVALID) {
      elements.push_back(subIter.readValue());
      if (!subIter.next())
        break;
    }

    return elements;
  }

  auto MessageIter::readEntries() -> BusDict {
    BusDict     entries;
    MessageIter dictIter = recurse();

    while (dictIter.getArgType() == DBUS_TYPE_DICT_ENTRY) {
      MessageIter entryIter = dictIter.recurse();

      BusValue key = entryIter.readValue();
      if (entryIter.next()) {
        if (auto* name = std::get_if<String>(&key.data))
          entries.insert_or_assign(std::move(*name), entryIter.readValue());
        else if (auto* number = std::get_if<i64>(&key.data))
          entries.insert_or_assign(std::to_string(*number), entryIter.readValue());
        else if (auto* unsignedNumber = std::get_if<u64>(&key.data))
          entries.insert_or_assign(std::to_string(*unsignedNumber), entryIter.readValue());
      }

      if (!dictIter.next())
        break;
    }

    return entries;
  }

  auto MessageIter::readValue() -> BusValue {
    switch (getArgType()) {
      case DBUS_TYPE_STRING:
      case DBUS_TYPE_OBJECT_PATH:
      case DBUS_TYPE_SIGNATURE:   return BusValue { *getString() };
      case DBUS_TYPE_BOOLEAN:     return BusValue { readBasic<dbus_bool_t>() != FALSE };
      case DBUS_TYPE_BYTE:        return BusValue { static_cast<u64>(readBasic<u8>()) };
      case DBUS_TYPE_INT16:       return BusValue { static_cast<i64>(readBasic<dbus_int16_t>()) };
      case DBUS_TYPE_UINT16:      return BusValue { static_cast<u64>(readBasic<dbus_uint16_t>()) };
      case DBUS_TYPE_INT32:       return BusValue { static_cast<i64>(readBasic<dbus_int32_t>()) };
      case DBUS_TYPE_UINT32:      return BusValue { static_cast<u64>(readBasic<dbus_uint32_t>()) };
      case DBUS_TYPE_INT64:       return BusValue { static_cast<i64>(readBasic<dbus_int64_t>()) };
      case DBUS_TYPE_UINT64:      return BusValue { static_cast<u64>(readBasic<dbus_uint64_t>()) };
      case DBUS_TYPE_DOUBLE:      return BusValue { static_cast<f64>(readBasic<double>()) };
      case DBUS_TYPE_VARIANT:     return recurse().readValue();
      case DBUS_TYPE_STRUCT:      return BusValue { readElements() };
      case DBUS_TYPE_ARRAY:
        if (getElementType() == DBUS_TYPE_DICT_ENTRY)
          return BusValue { readEntries() };
        return BusValue { readElements() };
      default: return BusValue {};
    }
  }

  auto DecodeSignal(const Message& message) -> Option<BusEvent> {
    if (message.isSignal(PROPERTIES_INTERFACE, "PropertiesChanged"))
      return DecodePropertiesChanged(message);

    if (message.isSignal(BUS_INTERFACE, "NameOwnerChanged"))
      return DecodeNameOwnerChanged(message);

    return None;
  }

  auto BuildNotifyCall(const RenderedNotification& notification) -> Result<Message> {
    Message call = TRY(Message::newMethodCall(NOTIFICATION_SERVICE, NOTIFICATION_PATH, NOTIFICATION_INTERFACE, "Notify"));

    if (!call.appendArgs(APP_NAME, u32 { 0 }, "", notification.subject.c_str(), notification.body.c_str()))
      ERR(InvalidArgument, "Notification text is not valid UTF-8");

    if (!call.appendWith([&notification](DBusMessageIter* iter) -> bool { return AppendActionsAndHints(iter, notification.icon); }))
      ERR(OutOfMemory, "Failed to append notification hints");

    if (!call.appendArgs(i32 { -1 }))
      ERR(OutOfMemory, "Failed to append notification timeout");

    return call;
  }

  auto BusSession::connect() -> Result<BusSession> {
    Connection connection = TRY(Connection::busGet(DBUS_BUS_SESSION));

    TRY_VOID(connection.addMatch(PROPERTIES_CHANGED_RULE));
    TRY_VOID(connection.addMatch(NAME_OWNER_CHANGED_RULE));

    return BusSession(std::move(connection));
  }

  auto BusSession::handleMessage(const Message& message) -> Result<Option<BusEvent>> {
    if (message.isSignal(LOCAL_INTERFACE, "Disconnected"))
      ERR(ApiUnavailable, "Disconnected from the session bus");

    switch (message.type()) {
      case DBUS_MESSAGE_TYPE_SIGNAL: return DecodeSignal(message);

      case DBUS_MESSAGE_TYPE_METHOD_RETURN:
        if (m_pendingNotifications.erase(message.replySerial()) > 0) {
          MessageIter iter = message.iterInit();
          if (iter.getArgType() == DBUS_TYPE_UINT32) {
            const BusValue notificationId = iter.readValue();
            debug_log("Notification daemon assigned id {}", std::get<u64>(notificationId.data));
          }
        }
        return None;

      case DBUS_MESSAGE_TYPE_ERROR:
        if (m_pendingNotifications.erase(message.replySerial()) > 0) {
          MessageIter iter = message.iterInit();
          warn_log(
            "Notification daemon rejected notification: {} {}",
            message.errorName().value_or("unknown error"),
            iter.getString().value_or("")
          );
        }
        return None;

      default: return None;
    }
  }

  auto BusSession::nextEvent(const std::chrono::milliseconds timeout) -> Result<Option<BusEvent>> {
    while (Option<Message> message = m_connection.popMessage()) {
      Option<BusEvent> event = TRY(handleMessage(*message));
      if (event)
        return event;
    }

    if (!m_connection.readWrite(static_cast<i32>(timeout.count())))
      ERR(ApiUnavailable, "Lost the session bus connection");

    while (Option<Message> message = m_connection.popMessage()) {
      Option<BusEvent> event = TRY(handleMessage(*message));
      if (event)
        return event;
    }

    return None;
  }

  auto BusSession::sendNotification(const RenderedNotification& notification) -> Result<u32> {
    const Message call   = TRY(BuildNotifyCall(notification));
    const u32     serial = TRY(m_connection.send(call));

    if (m_pendingNotifications.size() >= MAX_PENDING_NOTIFICATIONS)
      m_pendingNotifications.clear();
    m_pendingNotifications.insert(serial);

    return serial;
  }
} // namespace mpris_notifier::dbus
