#pragma once

#include <string>

#include "scheep/value.hpp"

namespace scheep {

// External representation: strings quoted and escaped.
std::string print_value(value v);
// What display writes: strings emitted raw.
std::string display_value(value v);

}  // namespace scheep
