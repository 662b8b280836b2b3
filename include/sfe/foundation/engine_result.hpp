#pragma once

/// @file engine_result.hpp
/// @brief EngineResult<T>: Result specialised on EngineError.

#include "sfe/core/result.hpp"
#include "sfe/foundation/engine_error.hpp"

namespace sfe::foundation {

template <typename T>
using EngineResult = sfe::Result<T, EngineError>;

}  // namespace sfe::foundation
