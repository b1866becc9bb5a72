#include "dbus/dbus.hpp"

#include <cstring>

#include "catch2/catch.hpp"
#include "metadata/metadata.hpp"

namespace mpris_notifier::dbus {
  namespace {
    // a{sv} with string values
    auto AppendStringDict(DBusMessageIter* iter, const Vec<std::pair<const char*, const char*>>& entries) -> bool {
      DBusMessageIter dict;
      if (!dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}", &dict))
        return false;

      for (const auto& [key, value] : entries) {
        DBusMessageIter entry;
        DBusMessageIter variant;
        dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
        dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, DBUS_TYPE_STRING_AS_STRING, &variant);
        dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &value);
        dbus_message_iter_close_container(&entry, &variant);
        dbus_message_iter_close_container(&dict, &entry);
      }

      return dbus_message_iter_close_container(iter, &dict);
    }

    auto PropertiesChangedSignal(const char* interface) -> Message {
      Result<Message> signal = Message::newSignal("/org/mpris/MediaPlayer2", "org.freedesktop.DBus.Properties", "PropertiesChanged");
      REQUIRE(signal);
      REQUIRE(dbus_message_set_sender(signal->get(), ":1.42"));

      REQUIRE(signal->appendArgs(interface));
      REQUIRE(signal->appendWith([](DBusMessageIter* iter) -> bool {
        DBusMessageIter changed;
        DBusMessageIter entry;
        DBusMessageIter variant;
        const char*     metadataKey = "Metadata";
        const char*     statusKey   = "PlaybackStatus";
        const char*     status      = "Playing";

        dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}", &changed);

        dbus_message_iter_open_container(&changed, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &metadataKey);
        dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "a{sv}", &variant);
        AppendStringDict(&variant, { { "xesam:title", "Song" }, { "xesam:album", "Album" } });
        dbus_message_iter_close_container(&entry, &variant);
        dbus_message_iter_close_container(&changed, &entry);

        dbus_message_iter_open_container(&changed, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &statusKey);
        dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, DBUS_TYPE_STRING_AS_STRING, &variant);
        dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &status);
        dbus_message_iter_close_container(&entry, &variant);
        dbus_message_iter_close_container(&changed, &entry);

        dbus_message_iter_close_container(iter, &changed);

        DBusMessageIter invalidated;
        dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, DBUS_TYPE_STRING_AS_STRING, &invalidated);
        return dbus_message_iter_close_container(iter, &invalidated);
      }));

      return std::move(*signal);
    }

    auto NameOwnerChangedSignal(const char* name, const char* oldOwner, const char* newOwner) -> Message {
      Result<Message> signal = Message::newSignal("/org/freedesktop/DBus", "org.freedesktop.DBus", "NameOwnerChanged");
      REQUIRE(signal);
      REQUIRE(signal->appendArgs(name, oldOwner, newOwner));
      return std::move(*signal);
    }
  } // namespace

  TEST_CASE("decoding PropertiesChanged", "[unit]") {
    SECTION("MPRIS player properties become an event") {
      const Option<BusEvent> event = DecodeSignal(PropertiesChangedSignal("org.mpris.MediaPlayer2.Player"));
      REQUIRE(event);

      const auto* changed = std::get_if<PropertiesChangedEvent>(&*event);
      REQUIRE(changed != nullptr);
      REQUIRE(changed->sourceId == ":1.42");

      const TrackMetadata data = metadata::Parse(changed->properties);
      REQUIRE(data.title == "Song");
      REQUIRE(data.album == "Album");
      REQUIRE(data.playbackStatus == PlaybackStatus::Playing);
    }

    SECTION("other interfaces are ignored") {
      REQUIRE_FALSE(DecodeSignal(PropertiesChangedSignal("org.mpris.MediaPlayer2")));
    }
  }

  TEST_CASE("decoding NameOwnerChanged", "[unit]") {
    SECTION("a unique name disconnecting") {
      const Option<BusEvent> event = DecodeSignal(NameOwnerChangedSignal(":1.42", ":1.42", ""));
      REQUIRE(event);
      REQUIRE(std::get<PeerRemovedEvent>(*event).sourceId == ":1.42");
    }

    SECTION("an MPRIS name released by its owner") {
      const Option<BusEvent> event = DecodeSignal(NameOwnerChangedSignal("org.mpris.MediaPlayer2.vlc", ":1.7", ""));
      REQUIRE(event);
      REQUIRE(std::get<PeerRemovedEvent>(*event).sourceId == ":1.7");
    }

    SECTION("names being acquired") {
      REQUIRE_FALSE(DecodeSignal(NameOwnerChangedSignal(":1.50", "", ":1.50")));
      REQUIRE_FALSE(DecodeSignal(NameOwnerChangedSignal("org.mpris.MediaPlayer2.vlc", "", ":1.7")));
    }

    SECTION("unrelated well-known names") {
      REQUIRE_FALSE(DecodeSignal(NameOwnerChangedSignal("org.example.Service", ":1.9", "")));
    }
  }

  TEST_CASE("building the Notify call", "[unit]") {
    RenderedNotification notification { .subject = "Song", .body = "Album - Artist", .icon = None };

    SECTION("text only") {
      const Result<Message> call = BuildNotifyCall(notification);
      REQUIRE(call);
      REQUIRE(std::strcmp(dbus_message_get_signature(call->get()), "susssasa{sv}i") == 0);
      REQUIRE(std::strcmp(dbus_message_get_member(call->get()), "Notify") == 0);
      REQUIRE(std::strcmp(dbus_message_get_destination(call->get()), NOTIFICATION_SERVICE) == 0);

      MessageIter iter = call->iterInit();
      REQUIRE(iter.getString() == "mpris-notifier");
      REQUIRE(iter.next());
      REQUIRE(std::get<u64>(iter.readValue().data) == 0);
      REQUIRE(iter.next());
      REQUIRE(iter.getString() == "");
      REQUIRE(iter.next());
      REQUIRE(iter.getString() == "Song");
      REQUIRE(iter.next());
      REQUIRE(iter.getString() == "Album - Artist");
      REQUIRE(iter.next());
      REQUIRE(std::get<BusArray>(iter.readValue().data).empty());
      REQUIRE(iter.next());

      const BusValue hints = iter.readValue();
      const auto&    dict  = std::get<BusDict>(hints.data);
      REQUIRE(std::get<String>(dict.at("x-canonical-private-synchronous").data) == "mpris-notifier");
      REQUIRE_FALSE(dict.contains("image-data"));

      REQUIRE(iter.next());
      REQUIRE(std::get<i64>(iter.readValue().data) == -1);
    }

    SECTION("with an image") {
      notification.icon = ImageData {
        .width         = 2,
        .height        = 1,
        .hasAlpha      = false,
        .bitsPerSample = 8,
        .channels      = 3,
        .rowstride     = 6,
        .pixels        = { 1, 2, 3, 4, 5, 6 },
      };

      const Result<Message> call = BuildNotifyCall(notification);
      REQUIRE(call);

      MessageIter iter = call->iterInit();
      for (int skip = 0; skip < 6; ++skip)
        REQUIRE(iter.next());

      const BusValue hints = iter.readValue();
      const auto&    image = std::get<BusArray>(std::get<BusDict>(hints.data).at("image-data").data);
      REQUIRE(image.size() == 7);
      REQUIRE(std::get<i64>(image[0].data) == 2);
      REQUIRE(std::get<i64>(image[1].data) == 1);
      REQUIRE(std::get<i64>(image[2].data) == 6);
      REQUIRE(std::get<bool>(image[3].data) == false);
      REQUIRE(std::get<i64>(image[4].data) == 8);
      REQUIRE(std::get<i64>(image[5].data) == 3);

      const auto& bytes = std::get<BusArray>(image[6].data);
      REQUIRE(bytes.size() == 6);
      REQUIRE(std::get<u64>(bytes[5].data) == 6);
    }

    SECTION("invalid UTF-8 is rejected instead of sent") {
      notification.subject = "bad \xff byte";
      REQUIRE_FALSE(BuildNotifyCall(notification));
    }
  }
} // namespace mpris_notifier::dbus
