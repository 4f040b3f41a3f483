#include "fiboblink_model.h"

namespace fiboblink {

CoreInputs FiboBlinkModel::inputs() const {
    CoreInputs in;
    in.rstN = rst_n & 1;
    in.ena = ena & 1;
    in.uiIn = ui_in;
    in.uioIn = uio_in;
    return in;
}

void FiboBlinkModel::eval() {
    const bool rising = (clk & 1) && !(m_lastClk & 1);
    m_lastClk = clk;
    OutputWords words;
    if (rising) {
        words = m_core.step(inputs());
        ++m_cycles;
    } else {
        words = m_core.outputs(inputs());
    }
    uo_out = words.uoOut;
    uio_out = words.uioOut;
    uio_oe = words.uioOe;
}

}  // namespace fiboblink
