#include "PlatformUtils.h"

#include <algorithm>
#include <chrono>
#include <cstdio>

namespace cptree {
namespace PlatformUtils {

// ============================================================================
// getTime - seconds since first call, monotonic
// ============================================================================
double getTime() {
    using Clock = std::chrono::steady_clock;
    static const auto startTime = Clock::now();
    std::chrono::duration<double> elapsed = Clock::now() - startTime;
    return elapsed.count();
}

// ============================================================================
// formatNumber - digit groups of three, least significant first
// ============================================================================
std::string formatNumber(int64_t number) {
    if (number == 0) {
        return "0";
    }

    bool negative = (number < 0);
    // Use unsigned to handle INT64_MIN correctly.
    uint64_t n = negative ? static_cast<uint64_t>(-(number + 1)) + 1u
                          : static_cast<uint64_t>(number);

    std::string result;
    int digitCount = 0;
    for (; n > 0; n /= 10, ++digitCount) {
        if (digitCount > 0 && digitCount % 3 == 0) {
            result += ',';
        }
        result += static_cast<char>('0' + static_cast<int>(n % 10));
    }
    if (negative) {
        result += '-';
    }

    std::reverse(result.begin(), result.end());
    return result;
}

// ============================================================================
// abbrevSize - B, kB, MB, GB, TB, PB, EB
// ============================================================================
std::string abbrevSize(int64_t size) {
    static const char* suffixes[] = {"B", "kB", "MB", "GB", "TB", "PB", "EB"};
    static const int numSuffixes = static_cast<int>(sizeof(suffixes) / sizeof(suffixes[0]));

    if (size < 0) {
        return "-" + abbrevSize(-size);
    }

    double s = static_cast<double>(size);
    int idx = 0;
    while (s >= 1024.0 && idx < numSuffixes - 1) {
        s /= 1024.0;
        idx++;
    }

    char buf[64];
    if (idx == 0) {
        std::snprintf(buf, sizeof(buf), "%d %s", static_cast<int>(s), suffixes[idx]);
    } else if (s < 10.0) {
        std::snprintf(buf, sizeof(buf), "%.2f %s", s, suffixes[idx]);
    } else if (s < 100.0) {
        std::snprintf(buf, sizeof(buf), "%.1f %s", s, suffixes[idx]);
    } else {
        std::snprintf(buf, sizeof(buf), "%.0f %s", s, suffixes[idx]);
    }
    return std::string(buf);
}

std::string formatPercent(int64_t part, int64_t whole) {
    double pct = whole != 0 ? 100.0 * static_cast<double>(part) / static_cast<double>(whole) : 0.0;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", pct);
    return std::string(buf);
}

} // namespace PlatformUtils
} // namespace cptree
