#include "fakes.hpp"

#include <log.hpp>
#include <gtest/gtest.h>

namespace btbatt::log {
namespace {

TEST(LogTest, WritesPrefixedLine) {
    fake::LogCapture capture(Level::Info);

    warn() << "gatt: " << 3 << " pending";
    info() << "report: done";

    EXPECT_EQ(capture.str(), "[warn] gatt: 3 pending\n[info] report: done\n");
}

TEST(LogTest, DisabledLevelsWriteNothing) {
    fake::LogCapture capture(Level::Warn);

    debug() << "bluez: hidden";
    info() << "report: hidden";
    error() << "dbus: shown";

    EXPECT_EQ(capture.str(), "[error] dbus: shown\n");
}

TEST(LogTest, OffIsSilent) {
    fake::LogCapture capture(Level::Off);

    error() << "dbus: hidden";

    EXPECT_TRUE(capture.str().empty());
    EXPECT_FALSE(enabled(Level::Off));
}

} // namespace
} // namespace btbatt::log
