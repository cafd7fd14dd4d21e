#include <tracksim/io/snapshot_recorder.hpp>
#include <tracksim/io/error.hpp>

#include <tracksim/core/error.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>

namespace tracksim::io {

SnapshotRecorder::SnapshotRecorder(core::Duration period)
    : period_(period) {
    if (period <= core::Duration::zero()) {
        throw core::ConfigurationError("Sampling period must be positive");
    }
}

void SnapshotRecorder::attach(core::Engine& engine) {
    current_ = positions_of(engine.particles());
    current_step_ = engine.step_index();
    if (period_) {
        // First sample at the first multiple of the period not before now.
        auto now = engine.time().time_since_epoch().nanoseconds();
        auto p = period_->nanoseconds();
        next_sample_ = core::time_from_nanoseconds(((now + p - 1) / p) * p);
    }
    engine.set_observer([this](const core::Snapshot& snapshot) { (*this)(snapshot); });
}

void SnapshotRecorder::operator()(const core::Snapshot& snapshot) {
    if (!period_) {
        samples_.push_back(PositionSample{snapshot.step, snapshot.time, positions_of(snapshot.particles)});
        return;
    }
    // Sampling times strictly before this step saw the previous state.
    emit_until(snapshot.time, false);
    current_ = positions_of(snapshot.particles);
    current_step_ = snapshot.step;
}

void SnapshotRecorder::flush(core::TimePoint until) {
    if (period_) {
        emit_until(until, true);
    }
}

void SnapshotRecorder::emit_until(core::TimePoint limit, bool inclusive) {
    while (next_sample_ < limit || (inclusive && next_sample_ == limit)) {
        samples_.push_back(PositionSample{current_step_, next_sample_, current_});
        next_sample_ = next_sample_ + *period_;
    }
}

std::vector<std::pair<core::ParticleId, core::Site>> SnapshotRecorder::positions_of(
    const core::ParticleRegistry& particles) {
    std::vector<std::pair<core::ParticleId, core::Site>> positions;
    positions.reserve(particles.size());
    for (const auto& [id, particle] : particles) {
        positions.emplace_back(id, particle.position());
    }
    return positions;
}

void SnapshotRecorder::write(std::ostream& out) const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartArray();
    for (const auto& sample : samples_) {
        writer.StartObject();
        writer.Key("step");
        writer.Uint64(sample.step);
        writer.Key("time");
        writer.Double(core::time_to_seconds(sample.time));
        writer.Key("particles");
        writer.StartArray();
        for (const auto& [id, site] : sample.positions) {
            writer.StartObject();
            writer.Key("id");
            writer.Uint64(id.value);
            writer.Key("position");
            writer.Int64(site);
            writer.EndObject();
        }
        writer.EndArray();
        writer.EndObject();
    }
    writer.EndArray();

    out << buffer.GetString() << "\n";
}

void SnapshotRecorder::write(const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write(file);
}

} // namespace tracksim::io
