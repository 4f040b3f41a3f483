#include "sequence_engine.h"

namespace fiboblink {

bool operator==(const SequenceState& lhs, const SequenceState& rhs) {
    return lhs.currentValue == rhs.currentValue && lhs.previousValue == rhs.previousValue
           && lhs.index == rhs.index;
}

bool operator!=(const SequenceState& lhs, const SequenceState& rhs) { return !(lhs == rhs); }

SequenceState seedSequence() { return SequenceState(); }

bool isPrime(uint32_t value) {
    if (value < 2) return false;
    for (uint32_t divisor = 2; divisor * divisor <= value; ++divisor) {
        if (value % divisor == 0) return false;
    }
    return true;
}

uint16_t nextPrime(uint16_t value) {
    // Search past the field width, then truncate: 4093 is followed by 4099,
    // which the register holds as 3.
    uint32_t candidate = value + 1u;
    while (!isPrime(candidate)) ++candidate;
    return static_cast<uint16_t>(candidate & kValueMask);
}

uint16_t nextTerm(SequenceVariant select, const SequenceState& state) {
    const uint32_t n = state.index;
    uint32_t term = 0;
    switch (select) {
    case SequenceVariant::Fibonacci:
        term = static_cast<uint32_t>(state.currentValue) + state.previousValue;
        break;
    case SequenceVariant::Prime: term = nextPrime(state.currentValue); break;
    case SequenceVariant::PerfectSquare: term = n * n; break;
    case SequenceVariant::Triangular:
        // n <= 65535, so n * (n + 1) still fits in 32 bits
        term = (n * (n + 1)) >> 1;
        break;
    }
    return static_cast<uint16_t>(term & kValueMask);
}

SequenceState advanceSequence(SequenceVariant select, const SequenceState& prev) {
    SequenceState next;
    next.currentValue = nextTerm(select, prev);
    next.previousValue = prev.currentValue;
    next.index = static_cast<uint16_t>(prev.index + 1);
    return next;
}

}  // namespace fiboblink
