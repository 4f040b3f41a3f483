#include "core_controller.h"

namespace fiboblink {

OutputWords CoreController::step(const CoreInputs& inputs) {
    if (!inputs.rstN) {
        m_state = CoreState::Reset;
        m_regs = CoreRegisters();
        return outputs(inputs);
    }
    m_state = CoreState::Run;
    if (!inputs.ena) return outputs(inputs);

    const Configuration config = decode(inputs.uiIn);
    const CoreRegisters prev = m_regs;

    m_regs.divider = advanceDivider(prev.divider, config.outputEnabled, config.speedCode);
    const bool tick = m_regs.divider.tick;

    bool committed = false;
    if (config.sequenceReset) {
        m_regs.sequence = seedSequence();
    } else if (tick) {
        m_regs.sequence = advanceSequence(config.select, prev.sequence);
        committed = true;
    }
    m_regs.blink = advanceBlink(prev.blink, tick, committed);
    return outputs(inputs);
}

OutputWords CoreController::outputs(const CoreInputs& inputs) const {
    const bool active = inputs.rstN && inputs.ena && decode(inputs.uiIn).outputEnabled;
    return pack(encodeView(m_regs.blink, m_regs.divider, m_regs.sequence, active));
}

}  // namespace fiboblink
