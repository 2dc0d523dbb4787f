#include "frame_driver.hpp"

#include <utility>

#include "../utility/logger.hpp"

const char *stop_reason_name(StopReason reason) noexcept {
    switch (reason) {
    case StopReason::Completed:
        return "completed";
    case StopReason::PolicyExhausted:
        return "policy exhausted";
    case StopReason::FrameLimit:
        return "frame limit";
    }
    return "unknown";
}

FrameDriver::FrameDriver(Simulation &sim, ControlPolicy policy)
    : m_sim(sim), m_policy(std::move(policy)) {
    m_report.total_bricks = m_sim.total_bricks();
    m_report.frame_duration_ms = m_sim.config().timing.frame_duration_ms;
}

std::optional<mailbox::FrameSnapshot> FrameDriver::next_frame() {
    const auto &cfg = m_sim.config();

    while (true) {
        switch (m_phase) {
        case Phase::Initial:
            m_phase = Phase::Targets;
            return emit({});

        case Phase::Targets: {
            if (frame_limit_reached()) {
                LOG_WARN("Frame limit ({}) reached with {} of {} bricks left",
                         cfg.watchdogs.max_frames,
                         m_sim.total_bricks() - m_sim.destroyed_count(),
                         m_sim.total_bricks());
                enter_end_pause(StopReason::FrameLimit);
                break;
            }

            if (!m_target) {
                m_target = next_target(m_policy, m_sim);
                if (!m_target) {
                    if (m_sim.is_complete()) {
                        enter_end_pause(StopReason::Completed);
                    } else {
                        LOG_INFO("Policy exhausted, forcing completion for up "
                                 "to {} frames",
                                 cfg.watchdogs.force_completion_frames);
                        m_force_frames_left =
                            cfg.watchdogs.force_completion_frames;
                        m_phase = Phase::ForceCompletion;
                    }
                    break;
                }
                ++m_report.targets;
                m_frames_on_target = 0;
                m_sim.set_paddle_target(*m_target);
            }

            const mailbox::StepEvents events = m_sim.step();
            ++m_report.steps;
            ++m_frames_on_target;

            if (m_sim.paddle_ready()) {
                m_target.reset();
            } else if (m_frames_on_target >= cfg.watchdogs.stuck_frame_limit) {
                LOG_WARN("Abandoning target x={} after {} frames", *m_target,
                         m_frames_on_target);
                ++m_report.abandoned_targets;
                m_target.reset();
            }
            return emit(events);
        }

        case Phase::ForceCompletion: {
            if (m_sim.is_complete()) {
                enter_end_pause(StopReason::Completed);
                break;
            }
            if (m_force_frames_left <= 0) {
                LOG_WARN("Giving up with {} of {} bricks left",
                         m_sim.total_bricks() - m_sim.destroyed_count(),
                         m_sim.total_bricks());
                enter_end_pause(StopReason::PolicyExhausted);
                break;
            }
            if (frame_limit_reached()) {
                enter_end_pause(StopReason::FrameLimit);
                break;
            }

            --m_force_frames_left;
            const mailbox::StepEvents events = m_sim.step();
            ++m_report.steps;
            return emit(events);
        }

        case Phase::EndPause:
            if (m_pause_frames_left > 0) {
                --m_pause_frames_left;
                return emit({});
            }
            m_phase = Phase::Padding;
            break;

        case Phase::Padding:
            if (m_report.frames < cfg.timing.min_frames) {
                return emit({});
            }
            finish();
            break;

        case Phase::Done:
            return std::nullopt;
        }
    }
}

RunReport
FrameDriver::run(const std::function<void(const mailbox::FrameSnapshot &)> &sink) {
    while (auto frame = next_frame()) {
        if (sink) {
            sink(*frame);
        }
    }
    return m_report;
}

bool FrameDriver::frame_limit_reached() const noexcept {
    return m_sim.frame_count() >= m_sim.config().watchdogs.max_frames;
}

mailbox::FrameSnapshot FrameDriver::emit(const mailbox::StepEvents &events) {
    ++m_report.frames;
    m_report.destroyed_bricks = m_sim.destroyed_count();
    m_report.complete = m_sim.is_complete();
    return m_sim.snapshot(events);
}

void FrameDriver::enter_end_pause(StopReason reason) {
    m_report.stop_reason =
        m_sim.is_complete() ? StopReason::Completed : reason;
    m_pause_frames_left = m_sim.config().timing.end_pause_frames;
    m_phase = Phase::EndPause;
}

void FrameDriver::finish() {
    m_report.destroyed_bricks = m_sim.destroyed_count();
    m_report.complete = m_sim.is_complete();
    m_phase = Phase::Done;

    LOG_INFO("Run finished ({}): {} frames, {} steps, {}/{} bricks, {} targets "
             "({} abandoned)",
             stop_reason_name(m_report.stop_reason), m_report.frames,
             m_report.steps, m_report.destroyed_bricks, m_report.total_bricks,
             m_report.targets, m_report.abandoned_targets);
}
