// Float core split by responsibility.
// Keep include order stable: these fragments form one translation unit.

#include "float_parts/01_lifecycle.cpp"
#include "float_parts/02_rounding_and_precision.cpp"
#include "float_parts/03_fold_protocol.cpp"
#include "float_parts/04_transcendental.cpp"
#include "float_parts/05_decimal_codec.cpp"
#include "float_parts/06_integer_bridge.cpp"
#include "float_parts/07_fit_and_compare.cpp"
