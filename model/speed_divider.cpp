#include "speed_divider.h"

#include "fiboblink_defs.h"

namespace fiboblink {

namespace {
const uint16_t s_periods[kSpeedCodes] = {512, 256, 128, 64, 48, 32, 24, 16};
}  // namespace

uint16_t dividerPeriod(uint8_t speedCode) { return s_periods[speedCode & (kSpeedCodes - 1)]; }

DividerState advanceDivider(const DividerState& prev, bool enabled, uint8_t speedCode) {
    DividerState next;
    if (!enabled) {
        next.counter = prev.counter;
        return next;
    }
    // >= so that switching to a shorter period never strands the counter above it
    const uint16_t count = prev.counter + 1;
    if (count >= dividerPeriod(speedCode)) {
        next.tick = true;
    } else {
        next.counter = count;
    }
    return next;
}

}  // namespace fiboblink
