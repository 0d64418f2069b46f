#include "TrialScheduler.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include "../utils/Logger.hpp"

namespace paradigmlab {
namespace trials {

namespace {

// sorted unique digits; throws if any is out of range
std::vector<int> normalize_digit_set(const std::vector<int>& digits, const char* which) {
	std::vector<int> out;
	out.reserve(digits.size());
	for (int d : digits) {
		if (d < 0 || d >= static_cast<int>(NUM_DIGITS)) {
			std::ostringstream oss;
			oss << which << " digit out of range: " << d;
			throw InvalidConfig_C(oss.str());
		}
		out.push_back(d);
	}
	std::sort(out.begin(), out.end());
	out.erase(std::unique(out.begin(), out.end()), out.end());
	return out;
}

void check_disjoint_non_empty(const std::vector<int>& go, const std::vector<int>& nogo) {
	if (go.empty()) {
		throw InvalidConfig_C("at least one Go digit is required");
	}
	if (nogo.empty()) {
		throw InvalidConfig_C("at least one No-Go digit is required");
	}
	std::vector<int> overlap;
	std::set_intersection(go.begin(), go.end(), nogo.begin(), nogo.end(), std::back_inserter(overlap));
	if (!overlap.empty()) {
		std::ostringstream oss;
		oss << "digits cannot be both Go and No-Go:";
		for (int d : overlap) oss << " " << d;
		throw InvalidConfig_C(oss.str());
	}
}

double positive_weight(const DigitWeights_T& weights, int digit) {
	const double w = weights[static_cast<std::size_t>(digit)];
	return (std::isfinite(w) && w > 0.0) ? w : 0.0;
}

double total_positive_weight(const std::vector<int>& digits, const DigitWeights_T& weights) {
	double total = 0.0;
	for (int d : digits) {
		total += positive_weight(weights, d);
	}
	return total;
}

struct ClassCandidates_S {
	std::vector<int> digits;
	std::vector<double> probs; // normalized to sum 1
};

ClassCandidates_S build_candidates(const std::vector<int>& digits, const DigitWeights_T& weights, const char* which) {
	ClassCandidates_S c;
	double total = 0.0;
	for (int d : digits) {
		const double w = positive_weight(weights, d);
		if (w > 0.0) {
			c.digits.push_back(d);
			c.probs.push_back(w);
			total += w;
		}
	}
	if (c.digits.empty() || total <= 0.0) {
		throw InvalidConfig_C(std::string("non-zero weights are required for ") + which + " digits");
	}
	for (double& p : c.probs) {
		p /= total;
	}
	return c;
}

void draw_with_replacement(const ClassCandidates_S& c, int count, bool isGo, std::mt19937& rng, BlockPlan_T& out) {
	if (count <= 0) return;
	std::discrete_distribution<std::size_t> pick(c.probs.begin(), c.probs.end());
	for (int i = 0; i < count; ++i) {
		out.push_back(TrialSpec_S{ c.digits[pick(rng)], isGo });
	}
}

} // namespace

double compute_go_ratio(const std::vector<int>& goDigits,
                        const std::vector<int>& nogoDigits,
                        const DigitWeights_T& weights) {
	const auto go = normalize_digit_set(goDigits, "Go");
	const auto nogo = normalize_digit_set(nogoDigits, "No-Go");
	check_disjoint_non_empty(go, nogo);

	const double totalGo = total_positive_weight(go, weights);
	const double totalNogo = total_positive_weight(nogo, weights);
	if (totalGo <= 0.0 || totalNogo <= 0.0) {
		throw InvalidConfig_C("non-zero weights required for both Go and No-Go digits");
	}
	return totalGo / (totalGo + totalNogo);
}

int go_count_for_block(int nTrialsPerBlock, double goRatio) {
	if (nTrialsPerBlock <= 0) return 0;
	// ties go to the even count (4.5 -> 4, 2.5 -> 2)
	const double exact = static_cast<double>(nTrialsPerBlock) * goRatio;
	double nGo = std::floor(exact);
	const double frac = exact - nGo;
	if (frac > 0.5 || (frac == 0.5 && std::fmod(nGo, 2.0) != 0.0)) {
		nGo += 1.0;
	}
	return static_cast<int>(std::clamp<double>(nGo, 0.0, static_cast<double>(nTrialsPerBlock)));
}

BlockPlan_T generate_trial_schedule(const std::vector<int>& goDigits,
                                    const std::vector<int>& nogoDigits,
                                    const DigitWeights_T& weights,
                                    double goRatio,
                                    int nTrialsPerBlock,
                                    std::mt19937& rng) {
	const auto go = normalize_digit_set(goDigits, "Go");
	const auto nogo = normalize_digit_set(nogoDigits, "No-Go");
	check_disjoint_non_empty(go, nogo);
	if (nTrialsPerBlock <= 0) {
		throw InvalidConfig_C("trials per block must be positive");
	}

	const int nGo = go_count_for_block(nTrialsPerBlock, goRatio);
	const int nNogo = nTrialsPerBlock - nGo;

	const auto goCandidates = build_candidates(go, weights, "Go");
	const auto nogoCandidates = build_candidates(nogo, weights, "No-Go");

	BlockPlan_T trials;
	trials.reserve(static_cast<std::size_t>(nTrialsPerBlock));
	draw_with_replacement(goCandidates, nGo, true, rng, trials);
	draw_with_replacement(nogoCandidates, nNogo, false, rng, trials);

	std::shuffle(trials.begin(), trials.end(), rng);

	LOG_DBG("trials: block plan nGo=" << nGo << " nNogo=" << nNogo);
	return trials;
}

TrialPlan_S build_trial_plan(const GoNoGoConfig_S& cfg, std::mt19937& rng) {
	if (cfg.n_blocks <= 0) {
		throw InvalidConfig_C("number of blocks must be positive");
	}
	TrialPlan_S plan;
	plan.go_ratio = compute_go_ratio(cfg.go_digits, cfg.nogo_digits, cfg.digit_weights);
	plan.blocks.reserve(static_cast<std::size_t>(cfg.n_blocks));
	for (int b = 0; b < cfg.n_blocks; ++b) {
		plan.blocks.push_back(generate_trial_schedule(cfg.go_digits, cfg.nogo_digits, cfg.digit_weights,
		                                              plan.go_ratio, cfg.n_trials_per_block, rng));
	}
	LOG_ALWAYS("trials: plan ready blocks=" << plan.blocks.size()
	           << " trials/block=" << cfg.n_trials_per_block
	           << " go_ratio=" << plan.go_ratio);
	return plan;
}

DigitProbabilities_S digit_probabilities(const std::vector<int>& goDigits,
                                         const std::vector<int>& nogoDigits,
                                         const DigitWeights_T& weights) {
	DigitProbabilities_S probs;
	double ratio = 0.0;
	try {
		ratio = compute_go_ratio(goDigits, nogoDigits, weights);
	}
	catch (const InvalidConfig_C& e) {
		LOG_DBG("trials: no preview, " << e.what());
		return probs;
	}
	const auto go = normalize_digit_set(goDigits, "Go");
	const auto nogo = normalize_digit_set(nogoDigits, "No-Go");
	const double goTotal = total_positive_weight(go, weights);
	const double nogoTotal = total_positive_weight(nogo, weights);
	for (int d : go) {
		probs.go[static_cast<std::size_t>(d)] = positive_weight(weights, d) / goTotal * ratio;
	}
	for (int d : nogo) {
		probs.nogo[static_cast<std::size_t>(d)] = positive_weight(weights, d) / nogoTotal * (1.0 - ratio);
	}
	return probs;
}

} // namespace trials
} // namespace paradigmlab
