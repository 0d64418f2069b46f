#pragma once
#include "../log/ExperimentLog.hpp"

namespace paradigmlab {
namespace analysis {

// Pure function over the log. Every logged trial counts toward its class;
// a pending trial (abort mid-window) is neither a hit nor a commission.
// Each value is nullopt when its denominator is zero.
GoNoGoMetrics_S compute_go_nogo_metrics(const ExperimentLog_S& log);

} // namespace analysis
} // namespace paradigmlab
