#pragma once

#include <cstdint>
#include <functional>
#include <string_view>
#include <vector>

#include "internal/model/candidate.hpp"
#include "internal/model/snapshot.hpp"

namespace stpa::combination {

struct GeneratorOptions {
  std::uint32_t max_combination_size                 = 3;
  bool          include_same_team_abstraction        = true;
  bool          include_cross_controller_abstraction = true;
  bool          include_co_occurrence_type           = true;
  bool          include_temporal_ordering_type       = true;
};

enum class GenerationStatus : std::uint8_t {
  kOk = 0,
  // Fewer than two in-scope controllers; an expected early-session state.
  kInsufficientControllers = 1,
  // max_combination_size does not fit the current scope; nothing ranked.
  kInvalidConfiguration = 2,
};

constexpr std::string_view ToString(GenerationStatus status) {
  switch (status) {
    case GenerationStatus::kInsufficientControllers:
      return "insufficient-controllers";
    case GenerationStatus::kInvalidConfiguration:
      return "invalid-configuration";
    case GenerationStatus::kOk:
    default:
      return "ok";
  }
}

struct GenerationResult {
  GenerationStatus status = GenerationStatus::kOk;
  std::vector<model::CandidateCombination> candidates;
};

/*
  Enumerates subsets of in-scope control actions, sizes 2..max, that span at
  least two controllers.

  Output order depends only on snapshot content: actions are taken in
  (controller id, action id) order, subsets in increasing size and then
  lexicographic index order, and each subset yields its co-occurrence
  candidate before its temporal-ordering one.
*/
class CombinationGenerator {
 public:
  using Visitor = std::function<void(model::CandidateCombination&&)>;

  explicit CombinationGenerator(GeneratorOptions options = {});

  // Streams candidates without materialising them. Throws
  // util::InvalidConfigurationError when max_combination_size is outside
  // [2, in-scope controllers].
  GenerationStatus ForEach(const model::Snapshot& snapshot, const Visitor& visit) const;

  GenerationResult Generate(const model::Snapshot& snapshot) const;

  const GeneratorOptions& options() const {
    return options_;
  }

 private:
  GeneratorOptions options_;
};

} // namespace stpa::combination
