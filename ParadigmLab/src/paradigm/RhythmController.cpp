#include "RhythmController.hpp"
#include <sstream>
#include <stdexcept>
#include <thread>
#include "../utils/Countdown.hpp"
#include "../utils/PeriodicSchedule.hpp"
#include "../utils/Logger.hpp"

RhythmController_C::RhythmController_C(RhythmConfig_S cfg, IStimulusSink_S& sink, StateStore_s* stateStoreRef)
	: cfg_(std::move(cfg)), sink_(sink), stateStoreRef_(stateStoreRef) {
}

const char* RhythmController_C::phase_instruction(RhythmPhase_E phase) {
	switch (phase) {
		case RhythmPhase_CuedMovement:
			return "Follow the cue";
		case RhythmPhase_InternalMovement:
			return "Move according to the previous rhythm";
		case RhythmPhase_RestPre:
		case RhythmPhase_RestInstruction:
		case RhythmPhase_RestPost:
		default:
			return "Rest";
	}
}

void RhythmController_C::request_abort(AbortReason_E reason) {
	if (reason == AbortReason_None) {
		reason = AbortReason_ClientAbort;
	}
	AbortReason_E expected = AbortReason_None;
	abortReason_.compare_exchange_strong(expected, reason, std::memory_order_acq_rel);
	abortRequested_.store(true, std::memory_order_release);
}

void RhythmController_C::setState(RhythmState_E state, int blockIdx) {
	state_.store(state, std::memory_order_release);
	if (stateStoreRef_ == nullptr) return;
	stateStoreRef_->g_state.store(static_cast<int>(state), std::memory_order_release);
	if (blockIdx >= 0) {
		stateStoreRef_->g_block.store(blockIdx + 1, std::memory_order_release);
	}
	stateStoreRef_->bump_seq();
}

void RhythmController_C::initLog() {
	log_ = ExperimentLog_S{};
	log_.paradigm = Paradigm_Rhythm;
	log_.meta.paradigm_name = cfg_.paradigm_name;
	log_.meta.language = cfg_.language;
	log_.meta.test_mode = cfg_.test_mode;
	log_.meta.notes = cfg_.notes;
	log_.meta.created_at = stopwatch_.start_wall();
	log_.config_json = paradigmlab::config::to_json(cfg_);
}

bool RhythmController_C::waitWithAbort(double duration_s) {
	const auto endTime = clock_T::now() + std::chrono::duration_cast<clock_T::duration>(seconds_d_T{ duration_s > 0.0 ? duration_s : 0.0 });
	while (clock_T::now() < endTime) {
		if (is_abort_requested()) {
			return false;
		}
		std::this_thread::sleep_for(PLAIN_WAIT_POLL_INTERVAL);
	}
	return !is_abort_requested();
}

bool RhythmController_C::waitWithCountdown(double duration_s, const std::string& message) {
	CountdownCallbacks_S cb;
	cb.on_tick = [this, &message](long long ms) { sink_.show_countdown(message, ms); };
	cb.on_finished = [this, &message]() { sink_.show_countdown(message, -1); };
	cb.should_abort = [this]() { return is_abort_requested(); };
	return run_blocking_countdown(duration_s, cb);
}

void RhythmController_C::triggerCue(PhaseRecord_S& phase) {
	if (!log_.accepts_timing()) return;
	phase.cue_events.push_back(stopwatch_.timestamp_pair());
	if (cfg_.cue_type == CueType_Audio) {
		sink_.play_tone(cfg_.cue_tone_hz, cfg_.cue_on_time_ms);
	} else {
		// sink hides it again after cue_on_time_ms
		sink_.show_visual_cue(cfg_.visual_color_hex, cfg_.visual_radius_px, cfg_.cue_on_time_ms);
	}
}

bool RhythmController_C::runCueTrain(PhaseRecord_S& phase, double duration_s) {
	if (cfg_.cue_frequency_hz <= 0.0) {
		return waitWithAbort(duration_s);
	}
	const auto start = clock_T::now();
	const auto endTime = start + std::chrono::duration_cast<clock_T::duration>(seconds_d_T{ duration_s > 0.0 ? duration_s : 0.0 });
	PeriodicSchedule_C schedule(start, period_from_hz(cfg_.cue_frequency_hz));

	while (true) {
		if (is_abort_requested()) {
			break;
		}
		const auto now = clock_T::now();
		if (now >= endTime) {
			break;
		}
		// one cue per poll; a late poll catches up on the following ones
		if (schedule.is_due(now)) {
			triggerCue(phase);
			schedule.advance();
		}
		std::this_thread::sleep_for(CUE_TRAIN_POLL_INTERVAL);
	}
	if (cfg_.cue_type == CueType_Visual) {
		sink_.hide_visual_cue();
	}
	LOG_DBG("RHY: cue train done, " << phase.cue_events.size() << " cues");
	return !is_abort_requested();
}

bool RhythmController_C::runPhase(RhythmBlockRecord_S& block, RhythmPhase_E phase) {
	PhaseRecord_S& rec = block.phases[phase];
	phase_.store(phase, std::memory_order_release);
	rec.start = stopwatch_.timestamp_pair();
	sink_.set_instruction_text(phase_instruction(phase));
	if (stateStoreRef_) {
		stateStoreRef_->g_trial.store(static_cast<int>(phase) + 1, std::memory_order_release);
		stateStoreRef_->bump_seq();
	}
	LOG_DBG("RHY: block " << block.block_index << " phase " << RhythmPhaseToKey(phase)
	        << " (" << rec.planned_duration_s << "s)");

	if (phase == RhythmPhase_CuedMovement) {
		return runCueTrain(rec, rec.planned_duration_s);
	}
	return waitWithAbort(rec.planned_duration_s);
}

bool RhythmController_C::runBlock(int blockIdx) {
	RhythmBlockRecord_S rec;
	rec.block_index = blockIdx;
	rec.block_start = stopwatch_.timestamp_pair();
	for (std::size_t i = 0; i < NUM_RHYTHM_PHASES; ++i) {
		rec.phases[i].phase = static_cast<RhythmPhase_E>(i);
		rec.phases[i].planned_duration_s = cfg_.phase_durations_s[i];
	}
	log_.rhythm_blocks.push_back(std::move(rec));
	LOG_ALWAYS("RHY: block " << (blockIdx + 1) << "/" << cfg_.num_blocks << " started");

	for (std::size_t i = 0; i < NUM_RHYTHM_PHASES; ++i) {
		if (!runPhase(log_.rhythm_blocks.back(), static_cast<RhythmPhase_E>(i))) {
			return false;
		}
	}
	return true;
}

void RhythmController_C::finalizeAbort() {
	sink_.hide_visual_cue();
	sink_.clear_screen();
	const TimestampPair_S ts = stopwatch_.timestamp_pair();
	log_.mark_aborted(abortReason_.load(std::memory_order_acquire), ts);
	setState(RhythmState_Aborted);
	if (stateStoreRef_) {
		stateStoreRef_->g_aborted.store(true, std::memory_order_release);
	}
	LOG_ALWAYS("RHY: aborted (" << log_.status.reason() << ") at " << ts.rel_s << "s");
}

ExperimentLog_S RhythmController_C::run() {
	logger::tlabel = "Rhythm";

	paradigmlab::config::validate(cfg_);
	if (state_.load(std::memory_order_acquire) != RhythmState_Idle) {
		throw std::runtime_error("Rhythm: controller already used; create a new one per run");
	}
	if (!runGuard_.try_acquire()) {
		throw std::runtime_error("Rhythm: another paradigm run is already active");
	}

	try {
		stopwatch_.start();
		initLog();
		log_.mark_running(stopwatch_.timestamp_pair());
		if (stateStoreRef_) {
			stateStoreRef_->reset_for_run(Paradigm_Rhythm);
		}
		LOG_ALWAYS("RHY: run started, " << cfg_.num_blocks << " blocks, cue "
		           << (cfg_.cue_type == CueType_Audio ? "audio" : "visual") << " @ " << cfg_.cue_frequency_hz << "Hz");

		setState(RhythmState_StartScreen);
		sink_.play_notification(cfg_.start_sound);
		sink_.set_instruction_text("Start");
		bool ok = waitWithAbort(std::chrono::duration_cast<seconds_d_T>(RHYTHM_START_SCREEN_DUR).count());

		for (int b = 0; ok && b < cfg_.num_blocks; ++b) {
			setState(RhythmState_Block, b);
			ok = runBlock(b);
			if (!ok) break;
			if (b < cfg_.num_blocks - 1) {
				setState(RhythmState_InterBlockRest, b);
				InterBlockInterval_S ibi;
				ibi.after_block = b;
				ibi.start = stopwatch_.timestamp_pair();
				ibi.planned_duration_s = cfg_.inter_block_interval_s;
				log_.rhythm_blocks.back().interval_after_block = ibi;

				std::ostringstream msg;
				msg << "Block " << (b + 1) << " finished.\nPlease rest.";
				ok = waitWithCountdown(cfg_.inter_block_interval_s, msg.str());
			}
		}

		if (!ok || is_abort_requested()) {
			finalizeAbort();
		} else {
			log_.mark_completed(stopwatch_.timestamp_pair());
			if (stateStoreRef_) {
				stateStoreRef_->g_completed.store(true, std::memory_order_release);
			}
			setState(RhythmState_EndScreen);
			sink_.play_notification(cfg_.end_sound);
			sink_.set_instruction_text("End");
			// end screen is display only; an abort here no longer changes the log
			(void)waitWithAbort(std::chrono::duration_cast<seconds_d_T>(RHYTHM_END_SCREEN_DUR).count());
			LOG_ALWAYS("RHY: completed");
			sink_.clear_screen();
			setState(RhythmState_Terminal);
		}
	} catch (const std::exception& e) {
		LOG_ERR("RHY: run failed: " << e.what());
		runGuard_.release();
		throw;
	}

	runGuard_.release();
	return log_;
}
