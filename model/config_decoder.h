// Input configuration word (ui_in) decoding.
//
//   bit 7    reserved, ignored
//   bit 6    output enable
//   bit 5    sequence reset (level)
//   bits 4:2 speed code, 0 = slowest, 7 = fastest
//   bits 1:0 sequence select

#ifndef FIBOBLINK_CONFIG_DECODER_H_
#define FIBOBLINK_CONFIG_DECODER_H_

#include <cstdint>

#include "fiboblink_defs.h"

namespace fiboblink {

namespace config_bits {
constexpr unsigned kOutputEnable = 6;
constexpr unsigned kSequenceReset = 5;
constexpr unsigned kSpeedShift = 2;
constexpr uint8_t kSpeedMask = 0x7;
constexpr uint8_t kSelectMask = 0x3;
}  // namespace config_bits

struct Configuration {
    bool outputEnabled = false;
    bool sequenceReset = false;
    uint8_t speedCode = 0;
    SequenceVariant select = SequenceVariant::Fibonacci;
};

bool operator==(const Configuration& lhs, const Configuration& rhs);
bool operator!=(const Configuration& lhs, const Configuration& rhs);

// Combinational; every one of the 256 words is valid.
Configuration decode(uint8_t word);

// Inverse of decode(). The reserved bit is always 0.
uint8_t encode(const Configuration& config);

}  // namespace fiboblink

#endif  // Guard
