#pragma once
#include <stdexcept>

namespace puzzlehub {

// Raised for grids, coordinates or digits that no engine operation accepts.
struct InvalidInputError : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

} // namespace puzzlehub
