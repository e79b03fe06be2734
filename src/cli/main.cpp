#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "hub/move_hub.hpp"
#include "transport/bluez_connection.hpp"
#include "util/constants.hpp"
#include "util/env.hpp"
#include "util/exitcodes.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace
{

static bool is_valid_mac(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else
        {
            unsigned char c = static_cast<unsigned char>(mac[i]);
            if (!std::isxdigit(c))
                return false;
        }
    }
    return true;
}

static std::string to_upper_mac(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  brickhub [--adapter <hciN>] [--mac AA:BB:CC:DD:EE:FF] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  info               hub name, MAC and battery\n"
                         "  peripherals        attached devices\n"
                         "  watch <seconds>    print sensor values and button presses\n"
                         "  off                switch the hub off\n");
}

static void print_info(const hub::HubInfo &info)
{
    std::printf("name:        %s\n", info.name ? info.name->c_str() : "?");
    std::printf("mac:         %s\n", info.mac ? info.mac->c_str() : "?");
    if (info.battery_percent)
        std::printf("battery:     %u%%\n", *info.battery_percent);
    else
        std::printf("battery:     ?\n");
    std::printf("low voltage: %s\n", info.low_voltage ? (*info.low_voltage ? "yes" : "no") : "?");
}

static int watch(hub::MoveHub &h, unsigned seconds)
{
    std::vector<std::shared_ptr<hub::Peripheral>> sensors;
    for (const auto &p : {h.tilt_sensor(), h.current(), h.voltage(), h.vision_sensor()})
    {
        if (p)
            sensors.push_back(p);
    }

    auto print_value = [](std::uint8_t port, const proto::Bytes &v) {
        std::printf("port 0x%02x: %s\n", (unsigned)port, brickhub::to_hex(v).c_str());
        std::fflush(stdout);
    };

    int subscribed = 0;
    for (const auto &p : sensors)
    {
        if (p->subscribe(print_value))
            ++subscribed;
        else
            std::fprintf(stderr, "warning: cannot subscribe to %s\n", p->describe().c_str());
    }
    if (h.button().subscribe([](bool pressed) {
            std::printf("button: %s\n", pressed ? "pressed" : "released");
            std::fflush(stdout);
        }))
        ++subscribed;

    if (subscribed == 0)
    {
        std::fprintf(stderr, "error: nothing to watch\n");
        return exitc::cmd_failed;
    }

    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (std::chrono::steady_clock::now() < until && h.is_connected())
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

    for (const auto &p : sensors)
        (void)p->unsubscribe();
    (void)h.button().unsubscribe();
    return exitc::ok;
}

static int run_cmd(hub::MoveHub &h, const std::string &cmd, const std::vector<std::string> &args)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"info",
         [&]() -> int {
             print_info(h.info());
             return exitc::ok;
         }},
        {"peripherals",
         [&]() -> int {
             for (const auto &kv : h.peripherals())
                 std::printf("%s\n", kv.second->describe().c_str());
             return exitc::ok;
         }},
        {"watch",
         [&]() -> int {
             char         *end = nullptr;
             unsigned long s   = std::strtoul(args[1].c_str(), &end, 10);
             return watch(h, static_cast<unsigned>(s));
         }},
        {"off",
         [&]() -> int {
             hub::SendResult r = h.switch_off();
             if (!r.ok())
             {
                 std::fprintf(stderr, "error: switch off failed: %s\n",
                              hub::send_status_name(r.status));
                 return exitc::cmd_failed;
             }
             return exitc::ok;
         }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
        return exitc::bad_args;
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}

static bool check_args(const std::vector<std::string> &args)
{
    const std::string &cmd = args[0];
    if (cmd == "info" || cmd == "peripherals" || cmd == "off")
        return args.size() == 1;
    if (cmd == "watch")
    {
        if (args.size() != 2)
            return false;
        char         *end = nullptr;
        unsigned long s   = std::strtoul(args[1].c_str(), &end, 10);
        return end && *end == '\0' && s >= 1 && s <= 86400;
    }
    return false;
}
}  // namespace

int main(int argc, char **argv)
{
    brickhub::init_log_level_from_env();

    transport::BluezConfig cfg = transport::BluezConfig::from_env();

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--adapter" && i + 1 < argc)
        {
            cfg.adapter = argv[++i];
        }
        else if (a == "--mac" && i + 1 < argc)
        {
            cfg.hub_addr = std::string(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty() || !check_args(args))
    {
        print_usage();
        return exitc::bad_args;
    }
    if (cfg.hub_addr)
    {
        cfg.hub_addr = to_upper_mac(*cfg.hub_addr);
        if (!is_valid_mac(*cfg.hub_addr))
        {
            std::fprintf(stderr, "error: invalid MAC address: %s\n", cfg.hub_addr->c_str());
            return exitc::bad_args;
        }
    }

    std::uint32_t connect_timeout_ms = constants::CONNECT_TIMEOUT_MS;
    brickhub::env_u32("BRICKHUB_CONNECT_TIMEOUT_MS", 1000, 600000, connect_timeout_ms);

    auto conn = std::make_unique<transport::BluezConnection>(cfg);
    if (!conn->start() || !conn->wait_ready(connect_timeout_ms))
    {
        std::fprintf(stderr, "error: no hub connection on %s\n", cfg.adapter.c_str());
        return exitc::conn_failed;
    }

    hub::MoveHub h(std::move(conn), hub::MoveHubConfig::from_env(), hub::HubConfig::from_env());
    if (h.desynced() || !h.is_connected())
    {
        std::fprintf(stderr, "error: hub link lost during start-up\n");
        return exitc::conn_failed;
    }

    const std::string cmd = args[0];
    int               rc  = run_cmd(h, cmd, args);

    if (cmd != "off" && h.is_connected())
    {
        hub::SendResult r = h.disconnect();
        if (!r.ok())
            LOG_WARN("hub disconnect request: %s", hub::send_status_name(r.status));
    }
    h.close();
    return rc;
}
