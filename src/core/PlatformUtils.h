#pragma once

#include <cstdint>
#include <string>

namespace cptree {
namespace PlatformUtils {

    // Get current time as double seconds (high-resolution monotonic clock).
    double getTime();

    // Format an int64 with comma separators (e.g., 1,234,567).
    std::string formatNumber(int64_t number);

    // Abbreviate byte size to human-readable form (e.g., "1.5 MB").
    std::string abbrevSize(int64_t size);

    // part / whole as a percentage with one decimal, e.g. "12.5%".
    // A zero whole gives "0.0%".
    std::string formatPercent(int64_t part, int64_t whole);

} // namespace PlatformUtils
} // namespace cptree
