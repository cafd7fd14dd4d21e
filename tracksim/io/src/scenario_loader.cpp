#include <tracksim/io/scenario_loader.hpp>
#include <tracksim/io/error.hpp>

#include "json_helpers.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <sstream>
#include <string>

namespace tracksim::io {

namespace {

using namespace tracksim::core;
using namespace tracksim::io::detail;

void parse_track(TrackParams& track, const rapidjson::Value& doc) {
    const auto& obj = get_object(doc, "track", "scenario");
    const std::string ctx = "track";

    uint64_t length = get_uint64(obj, "length", ctx);
    if (length == 0) {
        throw LoaderError("length must be positive", ctx);
    }
    track.length = static_cast<std::size_t>(length);

    if (obj.HasMember("boundary")) {
        std::string name = get_string(obj, "boundary", ctx);
        auto mode = boundary_mode_from_string(name);
        if (!mode) {
            throw LoaderError("unknown boundary mode '" + name + "' (expected closed, open or marked)", ctx);
        }
        track.boundary = *mode;
    }
}

void parse_engine(EngineConfig& config, const rapidjson::Value& doc) {
    if (!doc.HasMember("engine")) {
        return;
    }
    const auto& obj = get_object(doc, "engine", "scenario");
    const std::string ctx = "engine";

    if (obj.HasMember("policy")) {
        std::string name = get_string(obj, "policy", ctx);
        auto policy = scheduling_policy_from_string(name);
        if (!policy) {
            throw LoaderError("unknown policy '" + name + "' (expected synchronous or asynchronous)", ctx);
        }
        config.policy = *policy;
    }
    if (obj.HasMember("seed")) {
        config.seed = get_uint64(obj, "seed", ctx);
    }
    if (obj.HasMember("tick_length")) {
        double tick = get_double(obj, "tick_length", ctx);
        if (tick <= 0.0) {
            throw LoaderError("tick_length must be positive", ctx);
        }
        config.tick_length = duration_from_seconds(tick);
    }
    if (obj.HasMember("max_ticks")) {
        uint64_t max_ticks = get_uint64(obj, "max_ticks", ctx);
        if (max_ticks > 0) {
            config.step_limit = max_ticks;
        }
    }
    if (obj.HasMember("max_time")) {
        double max_time = get_double(obj, "max_time", ctx);
        if (max_time < 0.0) {
            throw LoaderError("max_time must not be negative", ctx);
        }
        if (max_time > 0.0) {
            config.time_limit = time_from_seconds(max_time);
        }
    }
    if (obj.HasMember("check_invariants")) {
        config.check_invariants = get_bool(obj, "check_invariants", ctx);
    }
}

void parse_particles(std::vector<ParticleSpec>& particles, const rapidjson::Value& doc) {
    if (!doc.HasMember("particles")) {
        // An empty track is valid
        return;
    }
    const auto& array = get_array(doc, "particles", "scenario");

    for (rapidjson::SizeType idx = 0; idx < array.Size(); ++idx) {
        const auto& obj = array[idx];
        std::string ctx = "particles[" + std::to_string(idx) + "]";
        if (!obj.IsObject()) {
            throw LoaderError("particle must be an object", ctx);
        }

        ParticleSpec spec;
        spec.position = get_optional_int64(obj, "position", ctx);
        spec.traits = get_string_array(obj, "traits", ctx);
        if (spec.traits.empty()) {
            throw LoaderError("a particle needs at least one trait", ctx);
        }
        if (obj.HasMember("state")) {
            spec.state = parse_state(obj["state"], ctx + ".state");
        }
        particles.push_back(std::move(spec));
    }
}

} // anonymous namespace

ScenarioData load_scenario(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_scenario_from_string(oss.str());
}

ScenarioData load_scenario_from_string(std::string_view json) {
    rapidjson::Document doc = parse_document(json, "scenario");

    ScenarioData result;
    parse_track(result.track, doc);
    parse_engine(result.engine, doc);
    parse_particles(result.particles, doc);
    return result;
}

void write_scenario_to_stream(const ScenarioData& scenario, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("track");
    writer.StartObject();
    writer.Key("length");
    writer.Uint64(scenario.track.length);
    writer.Key("boundary");
    writer.String(std::string(to_string(scenario.track.boundary)).c_str());
    writer.EndObject();

    const auto& config = scenario.engine;
    writer.Key("engine");
    writer.StartObject();
    writer.Key("policy");
    writer.String(std::string(to_string(config.policy)).c_str());
    writer.Key("seed");
    writer.Uint64(config.seed);
    writer.Key("tick_length");
    writer.Double(duration_to_seconds(config.tick_length));
    writer.Key("max_ticks");
    writer.Uint64(config.step_limit.value_or(0));
    writer.Key("max_time");
    writer.Double(config.time_limit ? time_to_seconds(*config.time_limit) : 0.0);
    writer.Key("check_invariants");
    writer.Bool(config.check_invariants);
    writer.EndObject();

    writer.Key("particles");
    writer.StartArray();
    for (const auto& spec : scenario.particles) {
        writer.StartObject();
        if (spec.position) {
            writer.Key("position");
            writer.Int64(*spec.position);
        }
        writer.Key("traits");
        writer.StartArray();
        for (const auto& trait : spec.traits) {
            writer.String(trait.c_str());
        }
        writer.EndArray();
        if (!spec.state.empty()) {
            writer.Key("state");
            write_state(writer, spec.state);
        }
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    out << buffer.GetString();
}

void write_scenario(const ScenarioData& scenario, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_scenario_to_stream(scenario, file);
}

std::unique_ptr<core::Engine> build_engine(const ScenarioData& scenario, core::RuleSet rules) {
    auto engine = std::make_unique<core::Engine>(
        core::Track(scenario.track.length, scenario.track.boundary), std::move(rules), scenario.engine);
    for (const auto& spec : scenario.particles) {
        engine->add_particle(spec);
    }
    return engine;
}

} // namespace tracksim::io
