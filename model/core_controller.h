// Top-level synchronous process of the FiboBlink core.
//
// Owns every register. step() is one rising clock edge: decode the input
// word, advance the divider, then either reseed or advance the sequence,
// then update the LED and pulse registers. The returned words are computed
// from the registers just committed and the inputs of that edge.
//
// rst_n low reseeds everything on the edge. ena low freezes every register
// and presents the disabled output pattern.

#ifndef FIBOBLINK_CORE_CONTROLLER_H_
#define FIBOBLINK_CORE_CONTROLLER_H_

#include <cstdint>

#include "blink_encoder.h"
#include "config_decoder.h"
#include "output_packer.h"
#include "sequence_engine.h"
#include "speed_divider.h"

namespace fiboblink {

struct CoreInputs {
    bool rstN = true;
    bool ena = true;
    uint8_t uiIn = 0;
    uint8_t uioIn = 0;  // not used by the core
};

struct CoreRegisters {
    DividerState divider;
    SequenceState sequence;
    BlinkState blink;
};

enum class CoreState { Reset, Run };

class CoreController {
public:
    CoreController() = default;

    OutputWords step(const CoreInputs& inputs);

    // Combinational outputs of the current registers for the given inputs.
    OutputWords outputs(const CoreInputs& inputs) const;

    const CoreRegisters& registers() const { return m_regs; }
    CoreState state() const { return m_state; }

private:
    CoreRegisters m_regs;
    CoreState m_state = CoreState::Reset;
};

}  // namespace fiboblink

#endif  // Guard
