#include <types/battery.hpp>
#include <types/device.hpp>
#include <gtest/gtest.h>

namespace btbatt {
namespace {

TEST(BatteryLevelTest, AcceptsOneToHundred) {
    for (uint8_t raw : {1, 50, 100}) {
        auto level = BatteryLevel::from_raw(raw);
        ASSERT_TRUE(level) << static_cast<int>(raw);
        EXPECT_EQ(level->percentage(), raw);
    }
}

TEST(BatteryLevelTest, RejectsUnavailableValues) {
    EXPECT_FALSE(BatteryLevel::from_raw(0));
    EXPECT_FALSE(BatteryLevel::from_raw(101));
    EXPECT_FALSE(BatteryLevel::from_raw(255));
}

TEST(BatteryLevelTest, ToString) {
    EXPECT_EQ(BatteryLevel::from_raw(75)->to_string(), "75%");
    EXPECT_EQ(BatteryLevel::from_raw(100)->to_string(), "100%");
}

TEST(DeviceTest, HasBatteryInfo) {
    Device device;
    EXPECT_FALSE(device.has_battery_info());

    device.battery.case_ = BatteryLevel::from_raw(10);
    EXPECT_TRUE(device.has_battery_info());
}

TEST(DeviceTest, AddressToString) {
    EXPECT_EQ(DeviceAddress::ble().to_string(), "BLE");
    EXPECT_EQ(DeviceAddress::classic("AA:BB:CC:DD:EE:FF").to_string(), "AA:BB:CC:DD:EE:FF");
}

} // namespace
} // namespace btbatt
