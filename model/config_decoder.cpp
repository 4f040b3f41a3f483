#include "config_decoder.h"

namespace fiboblink {

bool operator==(const Configuration& lhs, const Configuration& rhs) {
    return lhs.outputEnabled == rhs.outputEnabled && lhs.sequenceReset == rhs.sequenceReset
           && lhs.speedCode == rhs.speedCode && lhs.select == rhs.select;
}

bool operator!=(const Configuration& lhs, const Configuration& rhs) { return !(lhs == rhs); }

Configuration decode(uint8_t word) {
    Configuration config;
    config.outputEnabled = (word >> config_bits::kOutputEnable) & 1;
    config.sequenceReset = (word >> config_bits::kSequenceReset) & 1;
    config.speedCode = (word >> config_bits::kSpeedShift) & config_bits::kSpeedMask;
    config.select = static_cast<SequenceVariant>(word & config_bits::kSelectMask);
    return config;
}

uint8_t encode(const Configuration& config) {
    unsigned word = 0;
    if (config.outputEnabled) word |= 1u << config_bits::kOutputEnable;
    if (config.sequenceReset) word |= 1u << config_bits::kSequenceReset;
    word |= (config.speedCode & config_bits::kSpeedMask) << config_bits::kSpeedShift;
    word |= static_cast<unsigned>(config.select) & config_bits::kSelectMask;
    return static_cast<uint8_t>(word);
}

}  // namespace fiboblink
