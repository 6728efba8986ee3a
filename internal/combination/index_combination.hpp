#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace stpa::combination {

/*
  Lazy k-subset cursor over the indices [0, n).

  Subsets come out in lexicographic order, one at a time, with O(k) state
  and no recursion. Reset() restarts the sequence; the cursor is finite and
  Next() keeps returning false once exhausted.
*/
class IndexCombination {
 public:
  IndexCombination(std::size_t n, std::size_t k);

  // Writes the next subset into *out. False when the sequence is done.
  bool Next(std::vector<std::size_t>* out);

  void Reset();

  std::size_t n() const {
    return n_;
  }
  std::size_t k() const {
    return k_;
  }

  // C(n, k), saturating at UINT64_MAX.
  static std::uint64_t Count(std::size_t n, std::size_t k);

 private:
  std::size_t n_;
  std::size_t k_;
  std::vector<std::size_t> indices_;
  bool started_ = false;
  bool done_    = false;
};

} // namespace stpa::combination
