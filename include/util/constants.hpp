#pragma once
#include <cstdint>
#include <string_view>

namespace constants
{
// LEGO Wireless Protocol hub service and its single read/write/notify characteristic
inline constexpr std::string_view HUB_SVC_UUID  = "00001623-1212-efde-1623-785feabcd123";
inline constexpr std::string_view HUB_CHAR_UUID = "00001624-1212-efde-1623-785feabcd123";

// All commands are written to this handle; notifications are tagged with it.
inline constexpr std::uint16_t HUB_HARDWARE_HANDLE = 0x0E;

// Move Hub startup wait for built-in devices (60 x 100ms)
inline constexpr std::uint32_t DEVICE_WAIT_ATTEMPTS    = 60;
inline constexpr std::uint32_t DEVICE_WAIT_INTERVAL_MS = 100;

inline constexpr std::uint32_t CONNECT_TIMEOUT_MS = 30000;

}  // namespace constants
