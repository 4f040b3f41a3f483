// LED waveform and new-number pulse.
//
// The LED is a level that toggles on every divider tick, so it blinks at
// half the tick rate. The pulse is high for the single cycle on which a
// term is committed, together with the new value.

#ifndef FIBOBLINK_BLINK_ENCODER_H_
#define FIBOBLINK_BLINK_ENCODER_H_

#include <cstdint>

#include "sequence_engine.h"
#include "speed_divider.h"

namespace fiboblink {

struct BlinkState {
    bool led = false;
    bool newNumberPulse = false;
};

// Everything the output words carry, before packing.
struct OutputView {
    bool led = false;
    bool tick = false;
    bool sequenceActive = false;
    bool newNumberPulse = false;
    uint16_t value = 0;
};

BlinkState advanceBlink(const BlinkState& prev, bool tick, bool committed);

// active is output enable qualified by ena and rst_n.
OutputView encodeView(const BlinkState& blink, const DividerState& divider,
                      const SequenceState& sequence, bool active);

}  // namespace fiboblink

#endif  // Guard
