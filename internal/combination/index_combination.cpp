#include "internal/combination/index_combination.hpp"

#include <limits>

namespace stpa::combination {

IndexCombination::IndexCombination(std::size_t n, std::size_t k) : n_(n), k_(k) {
  Reset();
}

void IndexCombination::Reset() {
  indices_.resize(k_);
  for (std::size_t i = 0; i < k_; ++i)
    indices_[i] = i;
  started_ = false;
  done_    = k_ == 0 || k_ > n_;
}

bool IndexCombination::Next(std::vector<std::size_t>* out) {
  if (done_)
    return false;

  if (!started_) {
    started_ = true;
    *out     = indices_;
    return true;
  }

  // Rightmost position that can still move right.
  std::size_t i = k_;
  while (i > 0) {
    --i;
    if (indices_[i] < n_ - k_ + i) {
      ++indices_[i];
      for (std::size_t j = i + 1; j < k_; ++j)
        indices_[j] = indices_[j - 1] + 1;
      *out = indices_;
      return true;
    }
  }

  done_ = true;
  return false;
}

std::uint64_t IndexCombination::Count(std::size_t n, std::size_t k) {
  if (k > n)
    return 0;
  if (k > n - k)
    k = n - k;

  std::uint64_t result = 1;
  for (std::size_t i = 1; i <= k; ++i) {
    const std::uint64_t numerator = n - k + i;
    if (result > std::numeric_limits<std::uint64_t>::max() / numerator)
      return std::numeric_limits<std::uint64_t>::max();
    // result * numerator is divisible by i at every step.
    result = result * numerator / i;
  }
  return result;
}

} // namespace stpa::combination
