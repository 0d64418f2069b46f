#include "Metrics.hpp"
#include <cmath>

namespace paradigmlab {
namespace analysis {

namespace {

struct RunningMean_S {
	double sum = 0.0;
	int n = 0;
	void add(double v) {
		if (std::isfinite(v)) {
			sum += v;
			++n;
		}
	}
	std::optional<double> value() const {
		if (n == 0) return std::nullopt;
		return sum / n;
	}
};

std::optional<double> percent(int numerator, int denominator) {
	if (denominator <= 0) return std::nullopt;
	return 100.0 * static_cast<double>(numerator) / static_cast<double>(denominator);
}

} // namespace

GoNoGoMetrics_S compute_go_nogo_metrics(const ExperimentLog_S& log) {
	int goTrials = 0;
	int goHits = 0;
	int nogoTrials = 0;
	int nogoCommissions = 0;
	RunningMean_S rtHit;
	RunningMean_S rtCommission;

	for (const auto& block : log.gonogo_blocks) {
		for (const auto& trial : block.trials) {
			// pending trials (abort mid-window) count in the denominators only
			if (trial.is_go) {
				++goTrials;
				if (trial.outcome == TrialOutcome_Hit) {
					++goHits;
					rtHit.add(trial.reaction_time_s);
				}
			} else {
				++nogoTrials;
				if (trial.outcome == TrialOutcome_CommissionError) {
					++nogoCommissions;
					rtCommission.add(trial.reaction_time_s);
				}
			}
		}
	}

	GoNoGoMetrics_S m;
	m.go_hit_percent = percent(goHits, goTrials);
	m.nogo_commission_percent = percent(nogoCommissions, nogoTrials);
	m.mean_rt_go_hit = rtHit.value();
	m.mean_rt_nogo_commission = rtCommission.value();
	return m;
}

} // namespace analysis
} // namespace paradigmlab
