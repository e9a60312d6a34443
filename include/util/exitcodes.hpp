#pragma once

namespace exitc
{
constexpr int ok        = 0;
constexpr int failed    = 1;  // transfer or request failed
constexpr int bad_args  = 2;
constexpr int no_server = 3;
constexpr int not_found = 4;  // unknown/expired code or transfer
constexpr int cancelled = 5;
}  // namespace exitc
