#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>

#include "util/log.hpp"

namespace brickhub
{

inline std::string env_or(const char *key, const char *defv)
{
    const char *v = std::getenv(key);
    return (v && *v) ? std::string(v) : std::string(defv);
}

// Reads an unsigned decimal in [lo, hi]. Leaves `out` untouched and warns when the
// variable is set but invalid; returns true only when a value was taken from env.
inline bool env_u32(const char *key, std::uint32_t lo, std::uint32_t hi, std::uint32_t &out)
{
    const char *e = std::getenv(key);
    if (!e || !*e)
        return false;

    char         *p = nullptr;
    unsigned long v = std::strtoul(e, &p, 10);
    if (p && *p == '\0' && v >= lo && v <= hi)
    {
        out = static_cast<std::uint32_t>(v);
        LOG_INFO("Using %s=%u", key, (unsigned)out);
        return true;
    }
    LOG_WARN("Ignoring invalid %s='%s' (expect %u..%u)", key, e, (unsigned)lo, (unsigned)hi);
    return false;
}

}  // namespace brickhub
