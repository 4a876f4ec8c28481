#pragma once

// =============================================================================
// stockflow v1 - Stock-flow-auxiliary simulation engine
// =============================================================================
// Main header for the v1 API:
// - Model schema and structural validation
// - Restricted formula language (compile once, evaluate per step)
// - Auxiliary dependency resolution (fixed-pass or ordered)
// - Explicit Euler simulator with clamped stocks and flows
// - Concurrent scenario batches and result export
// =============================================================================

#include "stockflow/v1/types.hpp"
#include "stockflow/v1/errors.hpp"
#include "stockflow/v1/time_series.hpp"
#include "stockflow/v1/model.hpp"
#include "stockflow/v1/expression.hpp"
#include "stockflow/v1/resolver.hpp"
#include "stockflow/v1/simulation.hpp"
#include "stockflow/v1/scenario_runner.hpp"
#include "stockflow/v1/results_io.hpp"
#include "stockflow/v1/parser/model_parser.hpp"
