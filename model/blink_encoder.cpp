#include "blink_encoder.h"

namespace fiboblink {

BlinkState advanceBlink(const BlinkState& prev, bool tick, bool committed) {
    BlinkState next;
    next.led = tick ? !prev.led : prev.led;
    next.newNumberPulse = committed;
    return next;
}

OutputView encodeView(const BlinkState& blink, const DividerState& divider,
                      const SequenceState& sequence, bool active) {
    OutputView view;
    view.led = blink.led;
    view.tick = divider.tick;
    view.sequenceActive = active;
    view.newNumberPulse = blink.newNumberPulse;
    view.value = sequence.currentValue & kValueMask;
    return view;
}

}  // namespace fiboblink
