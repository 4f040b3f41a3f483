// Pin-level wrapper around CoreController.
//
// Exposes the same ports as the verilated FiboBlink RTL and is driven the
// same way: set the inputs, toggle clk, call eval(). A 0->1 transition of
// clk seen by eval() is one CoreController::step(); any other eval() only
// refreshes the combinational outputs.

#ifndef FIBOBLINK_MODEL_H_
#define FIBOBLINK_MODEL_H_

#include <cstdint>

#include "core_controller.h"

namespace fiboblink {

class FiboBlinkModel {
public:
    // Inputs
    uint8_t clk = 0;
    uint8_t rst_n = 0;
    uint8_t ena = 0;
    uint8_t ui_in = 0;
    uint8_t uio_in = 0;

    // Outputs
    uint8_t uo_out = 0;
    uint8_t uio_out = 0;
    uint8_t uio_oe = 0;

    void eval();

    // Rising edges seen so far.
    uint64_t cycles() const { return m_cycles; }
    const CoreController& core() const { return m_core; }

private:
    CoreInputs inputs() const;

    CoreController m_core;
    uint8_t m_lastClk = 0;
    uint64_t m_cycles = 0;
};

}  // namespace fiboblink

#endif  // Guard
