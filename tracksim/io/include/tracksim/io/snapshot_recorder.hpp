#pragma once

/// @file snapshot_recorder.hpp
/// @brief Position sampling during a run.
/// @ingroup io_reporting

#include <tracksim/core/engine.hpp>
#include <tracksim/core/types.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

namespace tracksim::io {

/// @brief Positions of all particles at one instant.
/// @ingroup io_reporting
struct PositionSample {
    uint64_t step;   ///< Last step included in the sample.
    core::TimePoint time;
    std::vector<std::pair<core::ParticleId, core::Site>> positions; ///< Ascending id.
};

/// @brief Observer that records particle positions while an engine runs.
///
/// Two modes exist. Without a period, one sample is taken after every
/// committed step (event-based reporting). With a period @c p, samples are
/// taken at times 0, p, 2p, ... and each holds the positions after every
/// step at or before the sampling time (time-based reporting). Since a
/// sampling time is only known to be complete once a later step arrives,
/// call flush() at the end of the run to emit the samples up to the final
/// time.
///
/// @code
/// io::SnapshotRecorder recorder(core::duration_from_seconds(0.5));
/// recorder.attach(engine);
/// engine.run_until(core::time_from_seconds(10.0));
/// recorder.flush(engine.time());
/// @endcode
///
/// The recorder must outlive the engine's use of the observer.
///
/// @ingroup io_reporting
/// @see core::Engine::set_observer
class SnapshotRecorder {
public:
    /// @brief Record after every committed step.
    SnapshotRecorder() = default;

    /// @brief Record on a fixed sampling period.
    /// @throws core::ConfigurationError if @p period is not positive.
    explicit SnapshotRecorder(core::Duration period);

    /// @brief Install this recorder as @p engine's observer.
    ///
    /// Captures the engine's current positions as the starting state.
    void attach(core::Engine& engine);

    /// @brief Process one committed step.
    void operator()(const core::Snapshot& snapshot);

    /// @brief Emit every pending periodic sample at or before @p until.
    /// No-op in every-step mode.
    void flush(core::TimePoint until);

    [[nodiscard]] const std::vector<PositionSample>& samples() const noexcept { return samples_; }
    [[nodiscard]] std::optional<core::Duration> period() const noexcept { return period_; }

    /// @brief Write the samples as a JSON array.
    void write(std::ostream& out) const;

    /// @brief Write the samples as JSON to the file at @p path.
    /// @throws LoaderError  If the file cannot be opened.
    void write(const std::filesystem::path& path) const;

private:
    static std::vector<std::pair<core::ParticleId, core::Site>> positions_of(
        const core::ParticleRegistry& particles);
    void emit_until(core::TimePoint limit, bool inclusive);

    std::optional<core::Duration> period_;
    core::TimePoint next_sample_{};
    uint64_t current_step_{0};
    std::vector<std::pair<core::ParticleId, core::Site>> current_;
    std::vector<PositionSample> samples_;
};

} // namespace tracksim::io
