/*
==============================================================================
	File: TrialScheduler.hpp
	Desc: Go/No-Go trial plan generation.
	* go ratio = positive Go weight / (positive Go weight + positive No-Go weight)
	* per block: nGo = round(n * ratio) clamped to [0, n], rest are No-Go
	* digits drawn with replacement from each class by normalized weight,
	  then the whole block is Fisher-Yates shuffled
	* every block is drawn independently (counts can differ by rounding only
	  in the sense that the same rounding is applied to each block)
==============================================================================
*/
#pragma once
#include <array>
#include <random>
#include <vector>
#include "../utils/Types.h"
#include "../utils/Errors.hpp"
#include "../config/ParadigmConfig.hpp"

namespace paradigmlab {
namespace trials {

using DigitWeights_T = std::array<double, NUM_DIGITS>;
using BlockPlan_T = std::vector<TrialSpec_S>;

struct TrialPlan_S {
	double go_ratio = 0.0;
	std::vector<BlockPlan_T> blocks; // blocks[0] is block 1
};

// Throws InvalidConfig_C on empty/overlapping sets, digits outside 0..9,
// or a class whose positive weights sum to <= 0.
double compute_go_ratio(const std::vector<int>& goDigits,
                        const std::vector<int>& nogoDigits,
                        const DigitWeights_T& weights);

// nGo for one block (round half away from zero, clamped)
int go_count_for_block(int nTrialsPerBlock, double goRatio);

BlockPlan_T generate_trial_schedule(const std::vector<int>& goDigits,
                                    const std::vector<int>& nogoDigits,
                                    const DigitWeights_T& weights,
                                    double goRatio,
                                    int nTrialsPerBlock,
                                    std::mt19937& rng);

TrialPlan_S build_trial_plan(const GoNoGoConfig_S& cfg, std::mt19937& rng);

// Probability of each digit appearing on a trial, split by class.
// Used for the operator preview; all zeros when the ratio is invalid.
struct DigitProbabilities_S {
	DigitWeights_T go{};
	DigitWeights_T nogo{};
};
DigitProbabilities_S digit_probabilities(const std::vector<int>& goDigits,
                                         const std::vector<int>& nogoDigits,
                                         const DigitWeights_T& weights);

} // namespace trials
} // namespace paradigmlab
