#include "fiboblink_defs.h"

namespace fiboblink {

const char* variantName(SequenceVariant variant) {
    switch (variant) {
    case SequenceVariant::Fibonacci: return "Fibonacci";
    case SequenceVariant::Prime: return "Prime";
    case SequenceVariant::PerfectSquare: return "Perfect Square";
    case SequenceVariant::Triangular: return "Triangular";
    }
    return "?";
}

}  // namespace fiboblink
