#pragma once

#include "stpa/coverage/v1/types.pb.h"
#include "stpa/coverage/v1/candidate.pb.h"
#include "stpa/coverage/v1/review.pb.h"
#include "stpa/coverage/v1/coverage_service.pb.h"
