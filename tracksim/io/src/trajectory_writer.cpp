#include <tracksim/io/trajectory_writer.hpp>
#include <tracksim/io/error.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <string>

namespace tracksim::io {

void write_trajectory_to_stream(const core::Trajectory& trajectory, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartArray();
    for (const auto& entry : trajectory) {
        writer.StartObject();
        writer.Key("step");
        writer.Uint64(entry.step);
        writer.Key("time");
        writer.Double(core::time_to_seconds(entry.time));
        writer.Key("particle");
        writer.Uint64(entry.particle.value);
        writer.Key("from");
        if (entry.from) {
            writer.Int64(*entry.from);
        } else {
            writer.Null();
        }
        writer.Key("to");
        if (entry.to) {
            writer.Int64(*entry.to);
        } else {
            writer.Null();
        }
        writer.Key("kind");
        writer.String(std::string(core::to_string(entry.kind)).c_str());
        writer.EndObject();
    }
    writer.EndArray();

    out << buffer.GetString() << "\n";
}

void write_trajectory(const core::Trajectory& trajectory, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_trajectory_to_stream(trajectory, file);
}

} // namespace tracksim::io
