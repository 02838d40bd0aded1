#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace hive {

// Wall-clock epoch milliseconds.
int64_t now_ms();

// Injectable time source. Components that make lease or idle decisions take
// one so tests can move time forward without sleeping.
using Clock = std::function<int64_t()>;

inline Clock system_clock_ms() { return [] { return now_ms(); }; }

// Cryptographically secure 32-bit random (getrandom, then /dev/urandom).
uint32_t secure_rand32();

// Lowercase hex of `bytes` random bytes.
std::string random_hex(size_t bytes = 16);

// RFC 4122 version-4 layout: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
std::string gen_task_id();

// UTC calendar date "YYYY-MM-DD" for an epoch-ms timestamp.
std::string utc_date(int64_t epoch_ms);

} // namespace hive
