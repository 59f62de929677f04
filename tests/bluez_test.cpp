#include "bluez_messages.hpp"

#include <bluez.hpp>
#include <gtest/gtest.h>

namespace bluez {
namespace {

using namespace messages;

constexpr const char* BATTERY_SERVICE_128 = "0000180f-0000-1000-8000-00805f9b34fb";
constexpr const char* BATTERY_LEVEL_128 = "00002A19-0000-1000-8000-00805F9B34FB";

ManagedObjects sample_objects() {
    ManagedObjectsMessage msg;
    msg.add("/org/bluez/hci0", {{ADAPTER_IFACE, {{"Powered", true}}}})
       .add("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01", {
            {DEVICE_IFACE, {
                {"Address", std::string("AA:BB:CC:DD:EE:01")},
                {"Name", std::string("Keyboard")},
                {"Paired", true},
                {"Connected", true},
                {"ServicesResolved", true},
            }},
            {BATTERY_IFACE, {{"Percentage", uint8_t{76}}}},
        })
       .add("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01/service0010", {
            {GATT_SERVICE_IFACE, {
                {"UUID", std::string(BATTERY_SERVICE_128)},
                {"Device", ObjectPath{"/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01"}},
                {"Primary", true},
            }},
        })
       .add("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01/service0010/char0011", {
            {GATT_CHARACTERISTIC_IFACE, {
                {"UUID", std::string(BATTERY_LEVEL_128)},
                {"Service", ObjectPath{"/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01/service0010"}},
            }},
        })
       .add("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01/service0020", {
            {GATT_SERVICE_IFACE, {
                {"UUID", std::string("00001812-0000-1000-8000-00805f9b34fb")},
                {"Device", ObjectPath{"/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01"}},
            }},
        })
       .add("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_02", {
            {DEVICE_IFACE, {
                {"Address", std::string("AA:BB:CC:DD:EE:02")},
                {"Alias", std::string("Speaker")},
                {"Paired", true},
                {"Connected", false},
            }},
        })
       .add("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_03", {
            {DEVICE_IFACE, {
                {"Address", std::string("AA:BB:CC:DD:EE:03")},
                {"Name", std::string("Stranger")},
                {"Paired", false},
                {"Connected", true},
            }},
        })
       .add("/org/bluez/hci0/dev_bogus", {
            {DEVICE_IFACE, {
                {"Address", std::string("not-a-mac")},
                {"Name", std::string("Odd")},
                {"Paired", true},
            }},
        });

    auto objects = parse_managed_objects(msg.finish());
    EXPECT_TRUE(objects);
    return objects.value_or(ManagedObjects{});
}

TEST(ExpandUuidTest, ShortUuidUsesBaseUuid) {
    EXPECT_EQ(expand_uuid("180F"), BATTERY_SERVICE_128);
    EXPECT_EQ(expand_uuid("2a19"), "00002a19-0000-1000-8000-00805f9b34fb");
}

TEST(ExpandUuidTest, FullUuidIsLowerCased) {
    EXPECT_EQ(expand_uuid(BATTERY_LEVEL_128), "00002a19-0000-1000-8000-00805f9b34fb");
}

TEST(ExpandUuidTest, UuidEquals) {
    EXPECT_TRUE(uuid_equals("2A19", BATTERY_LEVEL_128));
    EXPECT_TRUE(uuid_equals(BATTERY_SERVICE_128, "180f"));
    EXPECT_FALSE(uuid_equals("180F", "2A19"));
}

TEST(ParseManagedObjectsTest, Devices) {
    auto objects = sample_objects();

    ASSERT_EQ(objects.adapters.size(), 1u);
    EXPECT_EQ(objects.adapters[0], "/org/bluez/hci0");

    ASSERT_EQ(objects.devices.size(), 4u);
    const auto* keyboard = objects.find_device("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01");
    ASSERT_NE(keyboard, nullptr);
    EXPECT_EQ(keyboard->address, "AA:BB:CC:DD:EE:01");
    EXPECT_EQ(keyboard->display_name(), "Keyboard");
    EXPECT_TRUE(keyboard->connected);
    EXPECT_TRUE(keyboard->services_resolved);
    EXPECT_EQ(keyboard->battery_percentage, 76);

    const auto* speaker = objects.find_device("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_02");
    ASSERT_NE(speaker, nullptr);
    EXPECT_EQ(speaker->display_name(), "Speaker");
    EXPECT_FALSE(speaker->connected);
    EXPECT_FALSE(speaker->battery_percentage);

    EXPECT_EQ(objects.find_device("/org/bluez/hci0/dev_missing"), nullptr);
}

TEST(ParseManagedObjectsTest, RejectsWrongSignature) {
    DBusMessage* msg = dbus_message_new(DBUS_MESSAGE_TYPE_METHOD_RETURN);
    const char* s = "hello";
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &s, DBUS_TYPE_INVALID);

    EXPECT_FALSE(parse_managed_objects(msg));
    EXPECT_FALSE(parse_managed_objects(nullptr));
    dbus_message_unref(msg);
}

TEST(FindGattObjectsTest, MatchesOwnerAndUuid) {
    auto objects = sample_objects();

    auto services = find_services(objects, "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01", "180F");
    ASSERT_EQ(services.size(), 1u);
    EXPECT_EQ(services[0], "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01/service0010");

    EXPECT_TRUE(find_services(objects, "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_02", "180F").empty());

    auto chars = find_characteristics(objects, services[0], "2A19");
    ASSERT_EQ(chars.size(), 1u);
    EXPECT_EQ(chars[0], "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01/service0010/char0011");

    EXPECT_TRUE(find_characteristics(objects, "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_01/service0020",
                                     "2A19").empty());
}

TEST(ClassicDevicesTest, PairedDevicesOnly) {
    auto devices = classic_devices(sample_objects());

    ASSERT_EQ(devices.size(), 3u);

    EXPECT_EQ(devices[0].name, "Keyboard");
    EXPECT_EQ(devices[0].address, "AA:BB:CC:DD:EE:01");
    EXPECT_TRUE(devices[0].connected);
    EXPECT_EQ(devices[0].battery_single, 76);

    EXPECT_EQ(devices[1].name, "Speaker");
    EXPECT_FALSE(devices[1].connected);
    EXPECT_EQ(devices[1].battery_single, 0);

    EXPECT_EQ(devices[2].name, "Odd");
    EXPECT_EQ(devices[2].address, "unknown");
}

} // namespace
} // namespace bluez
