#include <shellwrap/util/bytes.hpp>
#include <cmath>
#include <cstdio>

namespace shellwrap {

std::string human_bytes(std::uint64_t n) {
    char buf[64];
    if (n < 1024) {
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(n));
        return buf;
    }
    double k = static_cast<double>(n) / 1024.0;
    if (k < 1024) {
        // half to even
        std::snprintf(buf, sizeof(buf), "%.0f KB", std::nearbyint(k));
        return buf;
    }
    double m = k / 1024.0;
    if (m < 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f MB", m);
        return buf;
    }
    std::snprintf(buf, sizeof(buf), "%.2f GB", m / 1024.0);
    return buf;
}

} // namespace shellwrap
