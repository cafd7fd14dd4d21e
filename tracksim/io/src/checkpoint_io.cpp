#include <tracksim/io/checkpoint_io.hpp>
#include <tracksim/io/error.hpp>

#include "json_helpers.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <sstream>
#include <type_traits>
#include <variant>

namespace tracksim::io {

namespace {

using namespace tracksim::core;
using namespace tracksim::io::detail;

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string(JsonWriter& writer, std::string_view value) {
    writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_optional_site(JsonWriter& writer, const std::optional<Site>& site) {
    if (site) {
        writer.Int64(*site);
    } else {
        writer.Null();
    }
}

void write_particle(JsonWriter& writer, const ParticleRecord& record) {
    writer.StartObject();
    writer.Key("id");
    writer.Uint64(record.id.value);
    writer.Key("position");
    writer.Int64(record.position);
    writer.Key("traits");
    writer.StartArray();
    for (const auto& trait : record.traits) {
        write_string(writer, trait);
    }
    writer.EndArray();
    writer.Key("state");
    write_state(writer, record.state);
    writer.Key("created_at_ns");
    writer.Int64(time_to_nanoseconds(record.created_at));
    writer.EndObject();
}

void write_pending(JsonWriter& writer, const PendingEvent& pending) {
    writer.StartObject();
    writer.Key("time_ns");
    writer.Int64(time_to_nanoseconds(pending.key.time));
    writer.Key("priority");
    writer.Int(pending.key.priority);
    writer.Key("sequence");
    writer.Uint64(pending.key.sequence);
    std::visit([&writer](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        writer.Key("kind");
        if constexpr (std::is_same_v<T, StepEvent>) {
            writer.String("step");
        } else {
            writer.String("expiry");
        }
        writer.Key("particle");
        writer.Uint64(ev.particle.value);
    }, pending.event);
    writer.EndObject();
}

void write_entry(JsonWriter& writer, const TrajectoryEntry& entry) {
    writer.StartObject();
    writer.Key("step");
    writer.Uint64(entry.step);
    writer.Key("time_ns");
    writer.Int64(time_to_nanoseconds(entry.time));
    writer.Key("particle");
    writer.Uint64(entry.particle.value);
    writer.Key("from");
    write_optional_site(writer, entry.from);
    writer.Key("to");
    write_optional_site(writer, entry.to);
    writer.Key("kind");
    write_string(writer, to_string(entry.kind));
    writer.EndObject();
}

TimePoint get_time(const rapidjson::Value& val, const char* name, const std::string& context) {
    return time_from_nanoseconds(get_int64(val, name, context));
}

ParticleRecord parse_particle(const rapidjson::Value& obj, const std::string& ctx) {
    ParticleRecord record;
    record.id = ParticleId{get_uint64(obj, "id", ctx)};
    record.position = get_int64(obj, "position", ctx);
    record.traits = get_string_array(obj, "traits", ctx);
    record.state = parse_state(get_member(obj, "state", ctx), ctx + ".state");
    record.created_at = get_time(obj, "created_at_ns", ctx);
    return record;
}

PendingEvent parse_pending(const rapidjson::Value& obj, const std::string& ctx) {
    EventKey key{get_time(obj, "time_ns", ctx),
                 static_cast<int>(get_int64(obj, "priority", ctx)),
                 get_uint64(obj, "sequence", ctx)};
    ParticleId particle{get_uint64(obj, "particle", ctx)};
    std::string kind = get_string(obj, "kind", ctx);
    if (kind == "step") {
        return PendingEvent{key, StepEvent{particle}};
    }
    if (kind == "expiry") {
        return PendingEvent{key, ExpiryEvent{particle}};
    }
    throw LoaderError("unknown event kind '" + kind + "'", ctx);
}

TrajectoryEntry parse_entry(const rapidjson::Value& obj, const std::string& ctx) {
    std::string kind_name = get_string(obj, "kind", ctx);
    auto kind = event_kind_from_string(kind_name);
    if (!kind) {
        throw LoaderError("unknown entry kind '" + kind_name + "'", ctx);
    }
    return TrajectoryEntry{get_uint64(obj, "step", ctx),
                           get_time(obj, "time_ns", ctx),
                           ParticleId{get_uint64(obj, "particle", ctx)},
                           get_optional_int64(obj, "from", ctx),
                           get_optional_int64(obj, "to", ctx),
                           *kind};
}

template<typename T, typename Parse>
std::vector<T> parse_list(const rapidjson::Value& doc, const char* name, Parse parse) {
    const auto& array = get_array(doc, name, "checkpoint");
    std::vector<T> result;
    result.reserve(array.Size());
    for (rapidjson::SizeType idx = 0; idx < array.Size(); ++idx) {
        std::string ctx = std::string(name) + "[" + std::to_string(idx) + "]";
        if (!array[idx].IsObject()) {
            throw LoaderError("element must be an object", ctx);
        }
        result.push_back(parse(array[idx], ctx));
    }
    return result;
}

} // anonymous namespace

void write_checkpoint_to_stream(const core::Checkpoint& checkpoint, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("version");
    writer.Uint64(CHECKPOINT_FORMAT_VERSION);

    writer.Key("track");
    writer.StartObject();
    writer.Key("length");
    writer.Uint64(checkpoint.track_length);
    writer.Key("boundary");
    write_string(writer, to_string(checkpoint.boundary));
    writer.EndObject();

    writer.Key("policy");
    write_string(writer, to_string(checkpoint.policy));
    writer.Key("finalized");
    writer.Bool(checkpoint.finalized);
    writer.Key("step");
    writer.Uint64(checkpoint.step);
    writer.Key("time_ns");
    writer.Int64(time_to_nanoseconds(checkpoint.time));
    writer.Key("next_id");
    writer.Uint64(checkpoint.next_id);
    writer.Key("sequence");
    writer.Uint64(checkpoint.sequence);
    writer.Key("rng_state");
    write_string(writer, checkpoint.rng_state);

    writer.Key("particles");
    writer.StartArray();
    for (const auto& record : checkpoint.particles) {
        write_particle(writer, record);
    }
    writer.EndArray();

    writer.Key("pending");
    writer.StartArray();
    for (const auto& pending : checkpoint.pending) {
        write_pending(writer, pending);
    }
    writer.EndArray();

    writer.Key("trajectory");
    writer.StartArray();
    for (const auto& entry : checkpoint.trajectory) {
        write_entry(writer, entry);
    }
    writer.EndArray();

    writer.EndObject();

    out << buffer.GetString();
}

void write_checkpoint(const core::Checkpoint& checkpoint, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_checkpoint_to_stream(checkpoint, file);
}

std::string checkpoint_to_string(const core::Checkpoint& checkpoint) {
    std::ostringstream oss;
    write_checkpoint_to_stream(checkpoint, oss);
    return oss.str();
}

core::Checkpoint read_checkpoint_from_string(std::string_view json) {
    rapidjson::Document doc = parse_document(json, "checkpoint");
    const std::string ctx = "checkpoint";

    uint64_t version = get_uint64(doc, "version", ctx);
    if (version != CHECKPOINT_FORMAT_VERSION) {
        throw LoaderError("unsupported format version " + std::to_string(version), ctx);
    }

    Checkpoint result;

    const auto& track = get_object(doc, "track", ctx);
    result.track_length = static_cast<std::size_t>(get_uint64(track, "length", "track"));
    std::string boundary = get_string(track, "boundary", "track");
    auto mode = boundary_mode_from_string(boundary);
    if (!mode) {
        throw LoaderError("unknown boundary mode '" + boundary + "'", "track");
    }
    result.boundary = *mode;

    std::string policy_name = get_string(doc, "policy", ctx);
    auto policy = scheduling_policy_from_string(policy_name);
    if (!policy) {
        throw LoaderError("unknown policy '" + policy_name + "'", ctx);
    }
    result.policy = *policy;

    result.finalized = get_bool(doc, "finalized", ctx);
    result.step = get_uint64(doc, "step", ctx);
    result.time = get_time(doc, "time_ns", ctx);
    result.next_id = get_uint64(doc, "next_id", ctx);
    result.sequence = get_uint64(doc, "sequence", ctx);
    result.rng_state = get_string(doc, "rng_state", ctx);

    result.particles = parse_list<ParticleRecord>(doc, "particles", parse_particle);
    result.pending = parse_list<PendingEvent>(doc, "pending", parse_pending);
    result.trajectory = parse_list<TrajectoryEntry>(doc, "trajectory", parse_entry);
    return result;
}

core::Checkpoint read_checkpoint(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return read_checkpoint_from_string(oss.str());
}

} // namespace tracksim::io
