// Shared widths and enumerations of the FiboBlink core.

#ifndef FIBOBLINK_DEFS_H_
#define FIBOBLINK_DEFS_H_

#include <cstdint>

namespace fiboblink {

// Width of the value register. Every term is truncated to this many bits,
// the way a fixed-width hardware register wraps.
constexpr unsigned kValueBits = 12;
constexpr uint16_t kValueMask = (1u << kValueBits) - 1;

constexpr unsigned kSpeedCodes = 8;

enum class SequenceVariant : uint8_t {
    Fibonacci = 0,
    Prime = 1,
    PerfectSquare = 2,
    Triangular = 3
};

const char* variantName(SequenceVariant variant);

}  // namespace fiboblink

#endif  // Guard
