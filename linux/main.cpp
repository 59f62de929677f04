#include "bluez.hpp"
#include "bluez_central.hpp"
#include "dbus.hpp"

#include <gatt/controller.hpp>
#include <log.hpp>
#include <report/aggregate.hpp>
#include <report/format.hpp>

#include <charconv>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#ifndef BTBATT_VERSION
#define BTBATT_VERSION "unknown"
#endif

namespace gatt = btbatt::gatt;
namespace report = btbatt::report;

struct Options {
    std::optional<std::string> device;
    bool json = false;
    bool debug = false;
    std::chrono::milliseconds timeout = gatt::DEFAULT_DISCOVERY_TIMEOUT;
};

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "\n"
              << "Show battery levels of connected Bluetooth devices\n"
              << "\n"
              << "Options:\n"
              << "  -d, --device <name>   Filter by device name (partial match, case-insensitive)\n"
              << "  -j, --json            Output in JSON format\n"
              << "  -t, --timeout <ms>    GATT discovery timeout (default "
              << gatt::DEFAULT_DISCOVERY_TIMEOUT.count() << ")\n"
              << "      --debug           Enable debug output\n"
              << "  -h, --help            Show this help\n"
              << "  -V, --version         Show version\n";
}

static std::optional<long> parse_positive(std::string_view s) {
    long value = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || end != s.data() + s.size() || value <= 0) {
        return std::nullopt;
    }
    return value;
}

// Returns an exit code when the program should stop right away
static std::optional<int> parse_args(int argc, char* argv[], Options* opts) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        std::optional<std::string_view> inline_value;

        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string_view::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        // Value for options that take one, from "--opt=value" or the next argument
        auto value = [&]() -> std::optional<std::string_view> {
            if (inline_value) return inline_value;
            if (i + 1 < argc) return std::string_view(argv[++i]);
            return std::nullopt;
        };

        if (arg == "-d" || arg == "--device") {
            auto v = value();
            if (!v) {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            opts->device = std::string(*v);
        } else if (arg == "-t" || arg == "--timeout") {
            auto v = value();
            auto ms = v ? parse_positive(*v) : std::nullopt;
            if (!ms) {
                std::cerr << "Invalid timeout: " << (v ? *v : "") << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            opts->timeout = std::chrono::milliseconds(*ms);
        } else if (arg == "-j" || arg == "--json") {
            opts->json = true;
        } else if (arg == "--debug") {
            opts->debug = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-V" || arg == "--version") {
            std::cout << "btbatt " << BTBATT_VERSION << std::endl;
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }
    return std::nullopt;
}

int main(int argc, char* argv[]) {
    Options opts;
    if (auto code = parse_args(argc, argv, &opts)) {
        return *code;
    }

    btbatt::log::set_level(opts.debug ? btbatt::log::Level::Debug : btbatt::log::Level::Off);
    btbatt::log::debug() << "btbatt: starting";

    gatt::BatteryMap levels;
    std::vector<btbatt::ClassicDevice> classic;

    DBusConnection* conn = dbus::connect_system_bus();
    if (conn) {
        {
            bluez::BluezCentral central(conn);
            dbus::Pump pump(conn);

            gatt::DiscoveryOptions discovery;
            discovery.timeout = opts.timeout;
            levels = gatt::discover_battery_levels(central, pump, discovery);
        }

        classic = bluez::find_paired_devices(conn);
        dbus_connection_unref(conn);
    }

    auto devices = report::merge_devices(levels, classic, opts.device);

    if (devices.empty()) {
        if (opts.device) {
            btbatt::log::warn() << "btbatt: no devices found matching filter " << *opts.device;
            std::cerr << "no devices found matching '" << *opts.device << "'" << std::endl;
        } else {
            btbatt::log::warn() << "btbatt: no devices with battery info found";
            std::cerr << "no devices with battery info found" << std::endl;
        }
        return 0;
    }

    if (opts.json) {
        std::cout << report::to_json(devices) << std::endl;
    } else {
        for (const auto& device : devices) {
            std::cout << report::format_device(device) << std::endl;
        }
    }
    return 0;
}
