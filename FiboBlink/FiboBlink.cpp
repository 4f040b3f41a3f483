#include <verilated.h>
#if VM_TRACE
#include <verilated_vcd_c.h>
#endif
#include "VFiboBlink.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include "config_decoder.h"
#include "output_packer.h"

#define CLOCK_PERIOD 10 // in nanoseconds

// Value of +name=value, or fallback when the plusarg is absent.
static bool plusargValue(const char *name, unsigned long max, unsigned long fallback,
                         unsigned long *value) {
    std::string prefix = std::string(name) + "=";
    const char *match = Verilated::commandArgsPlusMatch(prefix.c_str());
    if (!match || !*match) {
        *value = fallback;
        return true;
    }
    const char *text = match + 1 + prefix.size();
    char *end = nullptr;
    unsigned long parsed = std::strtoul(text, &end, 0);
    if (!*text || *end || parsed > max) {
        std::cerr << "Invalid +" << prefix << text << " (expected 0.." << max << ")" << std::endl;
        return false;
    }
    *value = parsed;
    return true;
}

int main(int argc, char **argv) {
    Verilated::commandArgs(argc, argv);

    unsigned long cycles, config, resetCycles;
    if (!plusargValue("cycles", 1000000000ul, 200, &cycles)
        || !plusargValue("config", 0xFF, 0x5C, &config)
        || !plusargValue("reset", 1000000ul, 5, &resetCycles)) {
        return 1;
    }
    if (resetCycles == 0) {
        std::cerr << "+reset must be at least 1 cycle" << std::endl;
        return 1;
    }

#if VM_TRACE
    const char *flag = Verilated::commandArgsPlusMatch("trace");
    bool tracing = flag && 0 == std::strcmp(flag, "+trace");
    // must be on before the model is constructed
    if (tracing) Verilated::traceEverOn(true);
#endif

    VFiboBlink *top = new VFiboBlink;
    uint64_t main_time = 0;

#if VM_TRACE
    VerilatedVcdC *trace = nullptr;
    if (tracing) {
        trace = new VerilatedVcdC;
        top->trace(trace, 99);
        Verilated::mkdir("logs");
        trace->open("logs/fiboblink.vcd");
        printf("Tracing into logs/fiboblink.vcd\n");
    }
#endif

    const fiboblink::Configuration decoded = fiboblink::decode(static_cast<uint8_t>(config));
    printf("config 0x%02lx: enable=%d reset=%d speed=%d sequence=%s\n", config,
           decoded.outputEnabled, decoded.sequenceReset, decoded.speedCode,
           fiboblink::variantName(decoded.select));

    // set initial state and hold reset
    top->clk = 0;
    top->ena = 1;
    top->rst_n = 0;
    top->ui_in = 0;
    top->uio_in = 0;
    top->eval();

    unsigned long total = resetCycles + cycles;
    for (unsigned long i = 0; i < total; i++) {
        if (i == resetCycles) {
            top->rst_n = 1;
            top->ui_in = static_cast<uint8_t>(config);
        }
        // ================
        top->clk = 0;
        top->eval();
#if VM_TRACE
        if (trace) trace->dump(main_time);
#endif
        main_time += CLOCK_PERIOD / 2;
        top->clk = 1;
        top->eval();
#if VM_TRACE
        if (trace) trace->dump(main_time);
#endif
        main_time += CLOCK_PERIOD / 2;
        // ================
        if (i < resetCycles) continue;

        fiboblink::OutputView view = fiboblink::unpack(top->uo_out, top->uio_out);
        printf("cycle %lu: led=%d tick=%d active=%d new=%d value=%u%s\n", i - resetCycles,
               view.led, view.tick, view.sequenceActive, view.newNumberPulse,
               static_cast<unsigned>(view.value), view.newNumberPulse ? " *" : "");
    }

    // Clean up
    top->final();
#if VM_TRACE
    if (trace) {
        trace->close();
        delete trace;
    }
#endif
    delete top;

    return 0;
}
