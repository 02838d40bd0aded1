#include "hive/ids.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#if defined(__linux__)
#include <sys/random.h>
#endif

namespace hive {

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

uint32_t secure_rand32() {
    uint32_t v = 0;
#if defined(__linux__)
    if (::getrandom(&v, sizeof(v), 0) == (ssize_t)sizeof(v)) return v;
#endif
    FILE* f = std::fopen("/dev/urandom", "rb");
    if (f) {
        size_t got = std::fread(&v, sizeof(v), 1, f);
        std::fclose(f);
        if (got == 1) return v;
    }
    // Both getrandom and /dev/urandom failed; ids would collide.
    throw std::runtime_error("secure_rand32: no source of random bytes");
}

std::string random_hex(size_t bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes; i += 4) {
        uint32_t r = secure_rand32();
        size_t remain = bytes - i;
        size_t use = remain < 4 ? remain : 4;
        for (size_t j = 0; j < use; j++) {
            oss << std::setw(2) << ((r >> (j * 8)) & 0xFF);
        }
    }
    return oss.str();
}

std::string gen_task_id() {
    std::string h = random_hex(16);
    h[12] = '4';
    static const char kVariant[] = "89ab";
    h[16] = kVariant[secure_rand32() & 3];
    return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" +
           h.substr(16, 4) + "-" + h.substr(20, 12);
}

std::string utc_date(int64_t epoch_ms) {
    std::time_t t = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

} // namespace hive
