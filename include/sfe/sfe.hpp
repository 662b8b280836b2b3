#pragma once

/// @file sfe.hpp
/// @brief Umbrella header for the sports forecast engine.

#include "sfe/core/result.hpp"
#include "sfe/model/forecaster.hpp"
#include "sfe/model/match_types.hpp"
#include "sfe/model/rating_engine.hpp"
#include "sfe/model/strength_fitter.hpp"
#include "sfe/version.hpp"
