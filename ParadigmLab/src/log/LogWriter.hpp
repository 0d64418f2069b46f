/*
==============================================================================
	File: LogWriter.hpp
	Desc: Serializes a finished ExperimentLog_S to JSON and persists it.
	Layout:
	{
	  "meta": {...}, "config": {...}, "status": {...},
	  "timing_absolute": { ... wall times as "YYYY-mm-dd HH:MM:SS.mmm" ... },
	  "timing_relative": { ... same keys, seconds since stopwatch start ... },
	  "metrics": {...} | null
	}
==============================================================================
*/
#pragma once
#include <optional>
#include <string>
#include "ExperimentLog.hpp"

namespace paradigmlab {
namespace logio {

enum Timeline_E {
	Timeline_Absolute,
	Timeline_Relative,
};

// Just the timing_* object for one timeline.
std::string serialize_timeline(const ExperimentLog_S& log, Timeline_E timeline);

std::string serialize_status(const ExperimentStatus_S& status);
std::string serialize_metrics(const std::optional<GoNoGoMetrics_S>& metrics);

std::string serialize_log(const ExperimentLog_S& log);

// Writes <folder>/<prefix>_<start stamp>.json. Returns the path written,
// or nullopt on failure (the log itself is never modified).
std::optional<std::string> persist_log(const ExperimentLog_S& log,
                                       const std::string& folder,
                                       const std::string& prefix);

} // namespace logio
} // namespace paradigmlab
