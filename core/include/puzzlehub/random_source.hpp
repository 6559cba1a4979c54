#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace puzzlehub {

// Uniform randomness handed to every engine call that needs it.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform integer in [0, bound). bound must be positive.
  virtual int next_index(int bound) = 0;

  // Uniform real in [0, 1).
  virtual double next_unit() = 0;
};

// Mersenne twister backed source; seeded from the steady clock by default.
class Mt19937Source : public RandomSource {
public:
  Mt19937Source();
  explicit Mt19937Source(uint64_t seed);

  int next_index(int bound) override;
  double next_unit() override;

  uint64_t seed() const { return seed_; }

private:
  uint64_t seed_;
  std::mt19937_64 rng_;
};

// Replays fixed sequences, cycling when exhausted. An empty index script
// always answers 0 and an empty unit script always answers 0.0.
class ScriptedSource : public RandomSource {
public:
  ScriptedSource() = default;
  ScriptedSource(std::vector<int> indices, std::vector<double> units);

  int next_index(int bound) override;
  double next_unit() override;

  int index_calls() const { return index_calls_; }
  int unit_calls() const { return unit_calls_; }

private:
  std::vector<int> indices_;
  std::vector<double> units_;
  std::size_t index_pos_ = 0;
  std::size_t unit_pos_ = 0;
  int index_calls_ = 0;
  int unit_calls_ = 0;
};

// Fisher-Yates shuffle driven by a RandomSource.
template <class T>
void shuffle_in_place(std::vector<T>& items, RandomSource& random) {
  for (int i = static_cast<int>(items.size()) - 1; i > 0; --i) {
    const int j = random.next_index(i + 1);
    std::swap(items[i], items[j]);
  }
}

template <class T, std::size_t N>
void shuffle_in_place(std::array<T, N>& items, RandomSource& random) {
  for (int i = static_cast<int>(N) - 1; i > 0; --i) {
    const int j = random.next_index(i + 1);
    std::swap(items[i], items[j]);
  }
}

} // namespace puzzlehub
