// Output word layout.
//
//   uo_out  bit 0    LED
//           bit 1    divider tick
//           bit 2    sequence active
//           bit 3    new number pulse
//           bits 7:4 value[3:0]
//   uio_out          value[11:4]
//   uio_oe           0xFF, uio is output only

#ifndef FIBOBLINK_OUTPUT_PACKER_H_
#define FIBOBLINK_OUTPUT_PACKER_H_

#include <cstdint>

#include "blink_encoder.h"

namespace fiboblink {

namespace output_bits {
constexpr unsigned kLed = 0;
constexpr unsigned kTick = 1;
constexpr unsigned kSequenceActive = 2;
constexpr unsigned kNewNumber = 3;
constexpr unsigned kValueLowShift = 4;
constexpr uint8_t kFlagsMask = 0x0F;
}  // namespace output_bits

struct OutputWords {
    uint8_t uoOut = 0;
    uint8_t uioOut = 0;
    uint8_t uioOe = 0xFF;
};

bool operator==(const OutputWords& lhs, const OutputWords& rhs);
bool operator!=(const OutputWords& lhs, const OutputWords& rhs);

// Flags are forced low unless the view is active; the value bits are not.
OutputWords pack(const OutputView& view);

// Reads the fields back from a pair of output words.
OutputView unpack(uint8_t uoOut, uint8_t uioOut);

}  // namespace fiboblink

#endif  // Guard
