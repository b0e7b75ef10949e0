#pragma once

#include "scheep/value.hpp"

namespace scheep {

// car, cdr, cons, null?, list, arithmetic, numeric comparison, eq?, display
// and newline.
primitive_table core_primitives();

}  // namespace scheep
