// Term generator for the four integer sequences.
//
// The engine holds the trailing pair of committed terms and a 1-based term
// index. advanceSequence() commits term(index) of the selected variant:
//
//   Fibonacci      current + previous
//   Prime          smallest prime above current (trial division)
//   PerfectSquare  index^2
//   Triangular     index * (index + 1) / 2
//
// Terms are truncated to kValueBits. Selecting a different variant does not
// reseed anything, so the next term may jump; only seedSequence() restarts.

#ifndef FIBOBLINK_SEQUENCE_ENGINE_H_
#define FIBOBLINK_SEQUENCE_ENGINE_H_

#include <cstdint>

#include "fiboblink_defs.h"

namespace fiboblink {

struct SequenceState {
    uint16_t currentValue = 0;
    uint16_t previousValue = 1;
    uint16_t index = 1;  // wraps at 16 bits
};

bool operator==(const SequenceState& lhs, const SequenceState& rhs);
bool operator!=(const SequenceState& lhs, const SequenceState& rhs);

// Reset value. The pair (current 0, previous 1) makes the first commit
// yield term(1) of every variant; the value field reads 0 until then.
SequenceState seedSequence();

// Next term for select given the committed state, without committing it.
uint16_t nextTerm(SequenceVariant select, const SequenceState& state);

// Commit one term: shift the trailing pair and bump the index.
SequenceState advanceSequence(SequenceVariant select, const SequenceState& prev);

bool isPrime(uint32_t value);

// Smallest prime strictly greater than value, truncated to kValueBits.
uint16_t nextPrime(uint16_t value);

}  // namespace fiboblink

#endif  // Guard
