#include "puzzlehub/random_source.hpp"
#include "puzzlehub/errors.hpp"
#include <chrono>
#include <string>

namespace puzzlehub {

Mt19937Source::Mt19937Source()
  : Mt19937Source(static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count())) {
}

Mt19937Source::Mt19937Source(uint64_t seed)
  : seed_(seed), rng_(seed) {
}

int Mt19937Source::next_index(int bound) {
  if (bound <= 0) {
    throw InvalidInputError("next_index bound must be positive, got " + std::to_string(bound));
  }
  std::uniform_int_distribution<int> dist(0, bound - 1);
  return dist(rng_);
}

double Mt19937Source::next_unit() {
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(rng_);
}

ScriptedSource::ScriptedSource(std::vector<int> indices, std::vector<double> units)
  : indices_(std::move(indices)), units_(std::move(units)) {
}

int ScriptedSource::next_index(int bound) {
  if (bound <= 0) {
    throw InvalidInputError("next_index bound must be positive, got " + std::to_string(bound));
  }
  ++index_calls_;
  if (indices_.empty()) return 0;
  const int value = indices_[index_pos_];
  index_pos_ = (index_pos_ + 1) % indices_.size();
  // scripted values are reduced into range so one script fits any bound
  return ((value % bound) + bound) % bound;
}

double ScriptedSource::next_unit() {
  ++unit_calls_;
  if (units_.empty()) return 0.0;
  const double value = units_[unit_pos_];
  unit_pos_ = (unit_pos_ + 1) % units_.size();
  return value;
}

} // namespace puzzlehub
