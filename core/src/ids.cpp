#include "codeloop/ids.h"

#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#if defined(__linux__)
  #include <sys/random.h>
#endif

namespace codeloop {

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
    throw std::runtime_error("secure_rand32: cannot obtain random bytes");
}

std::string gen_run_id() {
    const char* det = std::getenv("CODELOOP_DETERMINISTIC_RUN_ID");
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    if (det && std::string(det) == "1") {
        oss << std::setw(32) << 1234567;
        return oss.str();
    }
    for (int i = 0; i < 4; i++) oss << std::setw(8) << secure_rand32();
    return oss.str();
}

} // namespace codeloop
