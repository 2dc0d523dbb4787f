#pragma once

#include <functional>
#include <optional>

#include "../mailbox/frame_snapshot.hpp"
#include "policy.hpp"
#include "simulation.hpp"

/** @brief Why a run ended */
enum class StopReason { Completed, PolicyExhausted, FrameLimit };

const char *stop_reason_name(StopReason reason) noexcept;

/**
 * @brief Summary of one driver run
 */
struct RunReport {
    /** @brief Frames handed out, pause and padding frames included */
    long long frames = 0;
    /** @brief Simulation steps taken */
    long long steps = 0;
    int targets = 0;
    /** @brief Targets given up on by the stuck-frame watchdog */
    int abandoned_targets = 0;
    int total_bricks = 0;
    int destroyed_bricks = 0;
    bool complete = false;
    StopReason stop_reason = StopReason::Completed;
    int frame_duration_ms = 0;

    inline double duration_seconds() const noexcept {
        return (double)frames * frame_duration_ms / 1000.0;
    }
};

/**
 * @brief Turns a simulation and a control policy into a finite sequence of
 * frames
 *
 * Pull-based: every call to next_frame() runs just enough of the state
 * machine to produce one frame. The sequence is
 *   - one frame of the untouched board,
 *   - for each policy target, steps until the paddle settles (at least one
 *     step, at most stuck_frame_limit),
 *   - if the policy ran out with bricks left, up to force_completion_frames
 *     more steps,
 *   - end_pause_frames copies of the final board,
 *   - padding copies until min_frames frames exist.
 * The max_frames watchdog is checked before every step and skips straight to
 * the end pause.
 *
 * The driver is the simulation's only writer. It does not own the
 * simulation, which must outlive it.
 */
class FrameDriver {
  public:
    FrameDriver(Simulation &sim, ControlPolicy policy);
    ~FrameDriver() = default;
    FrameDriver(const FrameDriver &) = delete;
    FrameDriver &operator=(const FrameDriver &) = delete;
    FrameDriver(FrameDriver &&) = delete;
    FrameDriver &operator=(FrameDriver &&) = delete;

    /**
     * @brief Produces the next frame
     * @return The frame, or nothing once the run is over
     */
    std::optional<mailbox::FrameSnapshot> next_frame();

    /**
     * @brief Drains the remaining frames into sink
     * @return Final report
     */
    RunReport
    run(const std::function<void(const mailbox::FrameSnapshot &)> &sink);

    inline bool finished() const noexcept { return m_phase == Phase::Done; }
    inline const RunReport &report() const noexcept { return m_report; }
    inline const ControlPolicy &policy() const noexcept { return m_policy; }
    inline const Simulation &simulation() const noexcept { return m_sim; }

  private:
    enum class Phase { Initial, Targets, ForceCompletion, EndPause, Padding, Done };

    bool frame_limit_reached() const noexcept;
    mailbox::FrameSnapshot emit(const mailbox::StepEvents &events);
    void enter_end_pause(StopReason reason);
    void finish();

  private:
    Simulation &m_sim;
    ControlPolicy m_policy;
    Phase m_phase = Phase::Initial;

    std::optional<float> m_target;
    int m_frames_on_target = 0;
    int m_force_frames_left = 0;
    int m_pause_frames_left = 0;

    RunReport m_report;
};
