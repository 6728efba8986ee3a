#pragma once

#include <cstdint>

#include "internal/model/candidate.hpp"
#include "internal/model/coverage_cell.hpp"
#include "internal/model/snapshot.hpp"
#include "stpa/coverage/v1/candidate.pb.h"
#include "stpa/coverage/v1/review.pb.h"
#include "stpa/coverage/v1/types.pb.h"

namespace stpa::model {

namespace v1 = stpa::coverage::v1;

Snapshot FromProto(const v1::Snapshot& proto);

CellKey FromProto(const v1::CellKey& proto);
v1::CellKey ToProto(const CellKey& key);

CellState FromProto(v1::CellState state);
v1::CellState ToProto(CellState state);

Decision FromProto(v1::Decision decision);
v1::Decision ToProto(Decision decision);

// rank is 1-based.
v1::CandidateCombination ToProto(const CandidateCombination& candidate, std::uint32_t rank);

} // namespace stpa::model
