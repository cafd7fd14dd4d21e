#pragma once

// Private rapidjson helpers shared by the scenario and checkpoint readers.

#include <tracksim/core/particle.hpp>
#include <tracksim/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace tracksim::io::detail {

// Helper to get required member with error context
inline const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                          const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

inline double get_double(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

inline uint64_t get_uint64(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer", context);
    }
    return member.GetUint64();
}

inline int64_t get_int64(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsInt64()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer", context);
    }
    return member.GetInt64();
}

inline bool get_bool(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsBool()) {
        throw LoaderError(std::string("field '") + name + "' must be a boolean", context);
    }
    return member.GetBool();
}

inline std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

inline const rapidjson::Value& get_array(const rapidjson::Value& val, const char* name,
                                         const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

inline const rapidjson::Value& get_object(const rapidjson::Value& val, const char* name,
                                          const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsObject()) {
        throw LoaderError(std::string("field '") + name + "' must be an object", context);
    }
    return member;
}

// Optional site: absent or null means "none".
inline std::optional<int64_t> get_optional_int64(const rapidjson::Value& val, const char* name,
                                                 const std::string& context) {
    if (!val.HasMember(name) || val[name].IsNull()) {
        return std::nullopt;
    }
    return get_int64(val, name, context);
}

inline std::vector<std::string> get_string_array(const rapidjson::Value& val, const char* name,
                                                 const std::string& context) {
    const auto& array = get_array(val, name, context);
    std::vector<std::string> result;
    result.reserve(array.Size());
    for (rapidjson::SizeType i = 0; i < array.Size(); ++i) {
        if (!array[i].IsString()) {
            throw LoaderError(std::string("field '") + name + "' must contain only strings", context);
        }
        result.emplace_back(array[i].GetString(), array[i].GetStringLength());
    }
    return result;
}

// Integral JSON numbers load as int64_t, every other number as double.
inline core::StateMap parse_state(const rapidjson::Value& obj, const std::string& context) {
    if (!obj.IsObject()) {
        throw LoaderError("state must be an object", context);
    }
    core::StateMap state;
    for (auto it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
        std::string key(it->name.GetString(), it->name.GetStringLength());
        const auto& value = it->value;
        if (value.IsInt64()) {
            state.emplace(key, value.GetInt64());
        } else if (value.IsNumber()) {
            state.emplace(key, value.GetDouble());
        } else if (value.IsString()) {
            state.emplace(key, std::string(value.GetString(), value.GetStringLength()));
        } else {
            throw LoaderError("state '" + key + "' must be a number or a string", context);
        }
    }
    return state;
}

template<typename Writer>
void write_state(Writer& writer, const core::StateMap& state) {
    writer.StartObject();
    for (const auto& [key, value] : state) {
        writer.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
        std::visit([&writer](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, int64_t>) {
                writer.Int64(v);
            } else if constexpr (std::is_same_v<T, double>) {
                writer.Double(v);
            } else {
                writer.String(v.c_str(), static_cast<rapidjson::SizeType>(v.size()));
            }
        }, value);
    }
    writer.EndObject();
}

inline rapidjson::Document parse_document(std::string_view json, const std::string& what) {
    rapidjson::Document doc;
    // Saved doubles must read back bit-identical.
    doc.Parse<rapidjson::kParseFullPrecisionFlag>(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", what);
    }
    return doc;
}

} // namespace tracksim::io::detail
