#pragma once

namespace exitc
{
constexpr int ok           = 0;
constexpr int bad_args     = 2;
constexpr int conn_failed  = 3;
constexpr int cmd_failed   = 4;
}  // namespace exitc
