#include "output_packer.h"

namespace fiboblink {

bool operator==(const OutputWords& lhs, const OutputWords& rhs) {
    return lhs.uoOut == rhs.uoOut && lhs.uioOut == rhs.uioOut && lhs.uioOe == rhs.uioOe;
}

bool operator!=(const OutputWords& lhs, const OutputWords& rhs) { return !(lhs == rhs); }

OutputWords pack(const OutputView& view) {
    unsigned flags = 0;
    if (view.sequenceActive) {
        flags |= (view.led ? 1u : 0u) << output_bits::kLed;
        flags |= (view.tick ? 1u : 0u) << output_bits::kTick;
        flags |= 1u << output_bits::kSequenceActive;
        flags |= (view.newNumberPulse ? 1u : 0u) << output_bits::kNewNumber;
    }
    const unsigned value = view.value & kValueMask;
    OutputWords words;
    words.uoOut = static_cast<uint8_t>(((value & 0xF) << output_bits::kValueLowShift) | flags);
    words.uioOut = static_cast<uint8_t>(value >> 4);
    return words;
}

OutputView unpack(uint8_t uoOut, uint8_t uioOut) {
    OutputView view;
    view.led = (uoOut >> output_bits::kLed) & 1;
    view.tick = (uoOut >> output_bits::kTick) & 1;
    view.sequenceActive = (uoOut >> output_bits::kSequenceActive) & 1;
    view.newNumberPulse = (uoOut >> output_bits::kNewNumber) & 1;
    view.value = static_cast<uint16_t>((uioOut << 4) | (uoOut >> output_bits::kValueLowShift));
    return view;
}

}  // namespace fiboblink
