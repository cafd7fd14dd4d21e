#pragma once

#include <tracksim/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace tracksim::core {

/// @brief Sink for the engine's structured trace records.
/// @ingroup core
///
/// A record is built in four calls: begin() with the simulation time,
/// type() with the record name, any number of field() calls, then end().
/// The engine writes:
///
/// | type            | fields                                         |
/// |-----------------|------------------------------------------------|
/// | `place`, `move`, `swap`, `push`, `bounce`, `merge`, `remove`, `expire`, `exit`, `spawn` | `particle`, `step`, `from`?, `to`? |
/// | `move_rejected` | `particle`, `target`, `reason` (lost a contest or a claim) |
/// | `move_blocked`  | `particle`, `target`, `reason` (closed boundary) |
/// | `collision`     | `mover`, `occupant`, `outcome`, `source`, `trait`? |
/// | `dormant`       | `particle` (no stepping rule answered)         |
/// | `spawn_dropped` | `site`?                                        |
/// | `sim_finished`  | `reason`, `steps`                              |
///
/// Sites are signed (`int64_t`) since a rejected target may lie beyond
/// either end of the track. Particle ids and counters are unsigned.
///
/// The Engine holds a non-owning pointer; with none installed, tracing
/// costs one null check per record.
///
/// @see Engine::set_trace_writer()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Open a record stamped with @p time.
    virtual void begin(TimePoint time) = 0;

    /// @brief Name the current record (e.g. `"move"`, `"collision"`).
    virtual void type(std::string_view name) = 0;

    virtual void field(std::string_view key, double value) = 0;
    virtual void field(std::string_view key, uint64_t value) = 0;
    virtual void field(std::string_view key, int64_t value) = 0;
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief Close the current record.
    virtual void end() = 0;

    /// @brief Write a particle id as an unsigned field.
    void particle(std::string_view key, ParticleId id) { field(key, id.value); }

    /// @brief Write @p site if it is set; write nothing otherwise.
    void site(std::string_view key, std::optional<Site> value) {
        if (value) {
            field(key, *value);
        }
    }

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace tracksim::core
