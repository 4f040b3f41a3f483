#ifndef FIBOBLINK_SPEED_DIVIDER_H_
#define FIBOBLINK_SPEED_DIVIDER_H_

#include <cstdint>

namespace fiboblink {

struct DividerState {
    uint16_t counter = 0;
    bool tick = false;  // high for exactly one cycle per period
};

// Tick period in clock cycles for a 3-bit speed code. Strictly decreasing,
// 512 cycles at code 0 down to 16 cycles at code 7.
uint16_t dividerPeriod(uint8_t speedCode);

// One rising edge. A disabled divider holds its count and never ticks.
DividerState advanceDivider(const DividerState& prev, bool enabled, uint8_t speedCode);

}  // namespace fiboblink

#endif  // Guard
