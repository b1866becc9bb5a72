/**
 * @file dbus.hpp
 * @brief libdbus wrappers and the session-bus endpoint of mpris-notifier
 *
 * @details The wrappers own their libdbus handles. BusSession subscribes to
 * MPRIS PropertiesChanged signals and to NameOwnerChanged, turns them into
 * BusEvents, and sends org.freedesktop.Notifications.Notify calls without
 * waiting for their replies.
 */

#pragma once

#include <chrono>
#include <dbus/dbus.h>
#include <set>
#include <utility>

#include <Drac++/Utils/Error.hpp>
#include <Drac++/Utils/Types.hpp>

#include "../dispatcher/dispatcher.hpp"
#include "../notifier_types.hpp"

namespace mpris_notifier::dbus {
  using namespace draconis::utils::error;
  using enum DracErrorCode;

  inline constexpr const char* NOTIFICATION_SERVICE   = "org.freedesktop.Notifications";
  inline constexpr const char* NOTIFICATION_PATH      = "/org/freedesktop/Notifications";
  inline constexpr const char* NOTIFICATION_INTERFACE = "org.freedesktop.Notifications";
  inline constexpr const char* APP_NAME               = "mpris-notifier";

  inline constexpr StringView MPRIS_OBJECT_PATH = "/org/mpris/MediaPlayer2";
  inline constexpr StringView MPRIS_NAME_PREFIX = "org.mpris.MediaPlayer2.";

  /**
   * @brief RAII wrapper for DBusError
   */
  class Error {
    DBusError m_err {};
    bool      m_isInitialized = false;

   public:
    Error() : m_isInitialized(true) {
      dbus_error_init(&m_err);
    }

    ~Error() {
      if (m_isInitialized)
        dbus_error_free(&m_err);
    }

    Error(const Error&)                    = delete;
    auto operator=(const Error&) -> Error& = delete;
    Error(Error&&)                         = delete;
    auto operator=(Error&&) -> Error&      = delete;

    [[nodiscard]] auto isSet() const -> bool {
      return m_isInitialized && dbus_error_is_set(&m_err);
    }

    [[nodiscard]] auto message() const -> const char* {
      return isSet() ? m_err.message : "";
    }

    [[nodiscard]] auto get() -> DBusError* {
      return &m_err;
    }
  };

  /**
   * @brief Read cursor over a message's arguments
   */
  class MessageIter {
    DBusMessageIter m_iter {};
    bool            m_isValid = false;

    friend class Message;

    explicit MessageIter(const DBusMessageIter& iter, const bool isValid)
      : m_iter(iter), m_isValid(isValid) {}

    auto getBasic(RawPointer value) -> void {
      if (m_isValid)
        dbus_message_iter_get_basic(&m_iter, value);
    }

    template <typename T>
    auto readBasic() -> T {
      T value {};
      getBasic(static_cast<RawPointer>(&value));
      return value;
    }

    auto readElements() -> BusArray;
    auto readEntries() -> BusDict;

   public:
    MessageIter(const MessageIter&)                    = delete;
    auto operator=(const MessageIter&) -> MessageIter& = delete;
    MessageIter(MessageIter&&)                         = delete;
    auto operator=(MessageIter&&) -> MessageIter&      = delete;
    ~MessageIter()                                     = default;

    [[nodiscard]] auto getArgType() -> i32 {
      return m_isValid ? dbus_message_iter_get_arg_type(&m_iter) : DBUS_TYPE_INVALID;
    }

    [[nodiscard]] auto getElementType() -> i32 {
      return m_isValid ? dbus_message_iter_get_element_type(&m_iter) : DBUS_TYPE_INVALID;
    }

    auto next() -> bool {
      return m_isValid && dbus_message_iter_next(&m_iter);
    }

    [[nodiscard]] auto recurse() -> MessageIter {
      if (!m_isValid)
        return MessageIter({}, false);

      DBusMessageIter subIter;
      dbus_message_iter_recurse(&m_iter, &subIter);
      return MessageIter(subIter, true);
    }

    /**
     * @brief Returns the current string-like argument (string, object path or signature)
     */
    [[nodiscard]] auto getString() -> Option<String>;

    /**
     * @brief Decodes the current argument, whatever its type
     * @details Variants are unwrapped, dictionaries become BusDict, other
     * arrays and structs become BusArray, and unsupported types (file
     * descriptors) become an empty value.
     */
    [[nodiscard]] auto readValue() -> BusValue;
  };

  /**
   * @brief RAII wrapper for DBusMessage
   */
  class Message {
    DBusMessage* m_msg = nullptr;

    template <typename T>
    static auto appendArgInternal(DBusMessageIter& iter, T&& arg) -> bool {
      using DecayedT = std::decay_t<T>;
      if constexpr (std::is_convertible_v<DecayedT, const char*>) {
        const char* valuePtr = static_cast<const char*>(std::forward<T>(arg));
        // libdbus treats invalid UTF-8 as a programming error and aborts.
        if (!dbus_validate_utf8(valuePtr, nullptr))
          return false;
        return dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, static_cast<const RawPointer>(&valuePtr));
      } else if constexpr (std::is_same_v<DecayedT, bool>) {
        const dbus_bool_t value = arg ? TRUE : FALSE;
        return dbus_message_iter_append_basic(&iter, DBUS_TYPE_BOOLEAN, &value);
      } else if constexpr (std::is_same_v<DecayedT, u32>) {
        const dbus_uint32_t value = arg;
        return dbus_message_iter_append_basic(&iter, DBUS_TYPE_UINT32, &value);
      } else if constexpr (std::is_same_v<DecayedT, i32>) {
        const dbus_int32_t value = arg;
        return dbus_message_iter_append_basic(&iter, DBUS_TYPE_INT32, &value);
      } else {
        static_assert(!sizeof(T*), "Unsupported type passed to appendArgs");
        return false;
      }
    }

   public:
    explicit Message(DBusMessage* msg = nullptr) : m_msg(msg) {}

    ~Message() {
      if (m_msg)
        dbus_message_unref(m_msg);
    }

    Message(const Message&)                    = delete;
    auto operator=(const Message&) -> Message& = delete;

    Message(Message&& other) noexcept
      : m_msg(std::exchange(other.m_msg, nullptr)) {}

    auto operator=(Message&& other) noexcept -> Message& {
      if (this != &other) {
        if (m_msg)
          dbus_message_unref(m_msg);
        m_msg = std::exchange(other.m_msg, nullptr);
      }
      return *this;
    }

    [[nodiscard]] auto get() const -> DBusMessage* {
      return m_msg;
    }

    [[nodiscard]] auto iterInit() const -> MessageIter {
      if (!m_msg)
        return MessageIter({}, false);

      DBusMessageIter iter;
      const bool      isValid = dbus_message_iter_init(m_msg, &iter);
      return MessageIter(iter, isValid);
    }

    template <typename... Args>
    [[nodiscard]] auto appendArgs(Args&&... args) -> bool {
      if (!m_msg)
        return false;

      DBusMessageIter iter;
      dbus_message_iter_init_append(m_msg, &iter);

      bool success = true;
      ((success = success && appendArgInternal(iter, std::forward<Args>(args))), ...);
      return success;
    }

    /**
     * @brief Hands an append iterator positioned at the end of the message to `writer`
     */
    template <typename Writer>
    [[nodiscard]] auto appendWith(Writer&& writer) -> bool {
      if (!m_msg)
        return false;

      DBusMessageIter iter;
      dbus_message_iter_init_append(m_msg, &iter);
      return std::forward<Writer>(writer)(&iter);
    }

    [[nodiscard]] auto type() const -> i32 {
      return m_msg ? dbus_message_get_type(m_msg) : DBUS_MESSAGE_TYPE_INVALID;
    }

    [[nodiscard]] auto isSignal(const char* interface, const char* member) const -> bool {
      return m_msg && dbus_message_is_signal(m_msg, interface, member);
    }

    [[nodiscard]] auto sender() const -> Option<String> {
      if (const char* name = m_msg ? dbus_message_get_sender(m_msg) : nullptr)
        return String(name);
      return None;
    }

    [[nodiscard]] auto path() const -> Option<String> {
      if (const char* objectPath = m_msg ? dbus_message_get_path(m_msg) : nullptr)
        return String(objectPath);
      return None;
    }

    [[nodiscard]] auto replySerial() const -> u32 {
      return m_msg ? dbus_message_get_reply_serial(m_msg) : 0;
    }

    [[nodiscard]] auto errorName() const -> Option<String> {
      if (const char* name = m_msg ? dbus_message_get_error_name(m_msg) : nullptr)
        return String(name);
      return None;
    }

    static auto newMethodCall(const char* destination, const char* path, const char* interface, const char* method)
      -> Result<Message> {
      DBusMessage* rawMsg = dbus_message_new_method_call(destination, path, interface, method);
      if (!rawMsg)
        ERR(OutOfMemory, "dbus_message_new_method_call failed");
      return Message(rawMsg);
    }

    static auto newSignal(const char* path, const char* interface, const char* name) -> Result<Message> {
      DBusMessage* rawMsg = dbus_message_new_signal(path, interface, name);
      if (!rawMsg)
        ERR(OutOfMemory, "dbus_message_new_signal failed");
      return Message(rawMsg);
    }
  };

  /**
   * @brief RAII wrapper for DBusConnection
   */
  class Connection {
    DBusConnection* m_conn = nullptr;

   public:
    explicit Connection(DBusConnection* conn = nullptr) : m_conn(conn) {}

    ~Connection() {
      if (m_conn)
        dbus_connection_unref(m_conn);
    }

    Connection(const Connection&)                    = delete;
    auto operator=(const Connection&) -> Connection& = delete;

    Connection(Connection&& other) noexcept
      : m_conn(std::exchange(other.m_conn, nullptr)) {}

    auto operator=(Connection&& other) noexcept -> Connection& {
      if (this != &other) {
        if (m_conn)
          dbus_connection_unref(m_conn);
        m_conn = std::exchange(other.m_conn, nullptr);
      }
      return *this;
    }

    [[nodiscard]] auto get() const -> DBusConnection* {
      return m_conn;
    }

    auto addMatch(const char* rule) const -> Result<> {
      if (!m_conn)
        ERR(InvalidArgument, "Invalid connection");

      Error err;
      dbus_bus_add_match(m_conn, rule, err.get());

      if (err.isSet())
        ERR_FMT(ApiUnavailable, "Failed to add match rule '{}': {}", rule, err.message());

      return {};
    }

    /**
     * @brief Blocks for at most `timeoutMs` doing socket I/O
     * @return False once the connection is closed
     */
    auto readWrite(const i32 timeoutMs) const -> bool {
      return m_conn && dbus_connection_read_write(m_conn, timeoutMs);
    }

    [[nodiscard]] auto popMessage() const -> Option<Message> {
      if (DBusMessage* rawMsg = m_conn ? dbus_connection_pop_message(m_conn) : nullptr)
        return Message(rawMsg);
      return None;
    }

    /**
     * @brief Queues `message` without waiting for a reply
     * @return The serial the reply will refer to
     */
    auto send(const Message& message) const -> Result<u32> {
      if (!m_conn || !message.get())
        ERR(InvalidArgument, "Invalid connection or message");

      dbus_uint32_t serial = 0;
      if (!dbus_connection_send(m_conn, message.get(), &serial))
        ERR(OutOfMemory, "dbus_connection_send failed");

      dbus_connection_flush(m_conn);
      return serial;
    }

    static auto busGet(const DBusBusType busType) -> Result<Connection> {
      Error           err;
      DBusConnection* rawConn = dbus_bus_get(busType, err.get());

      if (err.isSet())
        ERR_FMT(ApiUnavailable, "DBus bus_get failed: {}", err.message());

      if (!rawConn)
        ERR(ApiUnavailable, "dbus_bus_get returned null without error");

      // A lost bus is reported through nextEvent instead of _exit().
      dbus_connection_set_exit_on_disconnect(rawConn, FALSE);
      return Connection(rawConn);
    }
  };

  /**
   * @brief Turns a signal into a BusEvent when it is one we care about
   * @details PropertiesChanged is kept only for the MPRIS player interface on
   * the MPRIS object path. NameOwnerChanged yields PeerRemoved when a unique
   * name disconnects, or when an MPRIS well-known name loses its owner (the
   * event then names the previous owner).
   */
  auto DecodeSignal(const Message& message) -> Option<BusEvent>;

  /**
   * @brief Builds the org.freedesktop.Notifications.Notify call for `notification`
   */
  auto BuildNotifyCall(const RenderedNotification& notification) -> Result<Message>;

  /**
   * @brief Session-bus connection used for both directions
   */
  class BusSession : public dispatcher::INotificationSink {
    Connection    m_connection;
    std::set<u32> m_pendingNotifications;

    explicit BusSession(Connection connection) : m_connection(std::move(connection)) {}

    auto handleMessage(const Message& message) -> Result<Option<BusEvent>>;

   public:
    /**
     * @brief Connects to the session bus and installs the signal subscriptions
     */
    static auto connect() -> Result<BusSession>;

    /**
     * @brief Waits up to `timeout` for the next relevant signal
     * @return None when nothing arrived, or an error when the bus connection is gone
     */
    auto nextEvent(std::chrono::milliseconds timeout) -> Result<Option<BusEvent>>;

    auto sendNotification(const RenderedNotification& notification) -> Result<u32> override;
  };
} // namespace mpris_notifier::dbus
