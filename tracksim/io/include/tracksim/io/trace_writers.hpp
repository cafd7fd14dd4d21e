#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations.
///
/// The engine emits one record per committed change (`move`, `swap`,
/// `push`, `merge`, `expire`, ...), per resolved collision and per run
/// termination. These writers send those records nowhere, to a JSON
/// array, to memory or to a column-aligned text log.
///
/// @ingroup io_writers

#include <tracksim/core/trace_writer.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <functional>
#include <map>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tracksim::io {

/// @brief Trace writer that discards every record.
///
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint /*time*/) override {}
    void type(std::string_view /*name*/) override {}
    void field(std::string_view /*key*/, double /*value*/) override {}
    void field(std::string_view /*key*/, uint64_t /*value*/) override {}
    void field(std::string_view /*key*/, int64_t /*value*/) override {}
    void field(std::string_view /*key*/, std::string_view /*value*/) override {}
    void end() override {}
};

/// @brief Streams records to @p output as the elements of one JSON array.
///
/// Each record is serialised with rapidjson as a single-line object whose
/// first two members are `time` (seconds) and `type`:
///
/// @code{.json}
/// [
///   {"time":1.0,"type":"move","particle":2,"from":4,"to":5},
///   {"time":1.0,"type":"sim_finished","reason":"step_limit","steps":1}
/// ]
/// @endcode
///
/// The closing bracket is written by @ref finalize, or by the destructor if
/// finalize() was never called.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter, TextualTraceWriter
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Close the array. Safe to call more than once.
    void finalize();

    /// @brief Number of records written so far.
    [[nodiscard]] std::size_t record_count() const noexcept { return records_; }

private:
    void key(std::string_view name);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    rapidjson::StringBuffer buffer_;
    rapidjson::Writer<rapidjson::StringBuffer> writer_;
    std::size_t records_{0};
    bool in_record_{false};
    bool finalized_{false};
};

/// @brief Value of one trace field, with the type the engine wrote it as.
/// @ingroup io_writers
using TraceValue = std::variant<double, uint64_t, int64_t, std::string>;

/// @brief One buffered trace record.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter
struct TraceRecord {
    double time{0.0};  ///< Seconds.
    std::string type;
    std::map<std::string, TraceValue, std::less<>> fields;

    /// @brief Returns true if the record carries field @p key.
    [[nodiscard]] bool has(std::string_view key) const { return fields.find(key) != fields.end(); }

    /// @brief Typed access to field @p key.
    /// @throws std::out_of_range if the field is absent.
    /// @throws std::bad_variant_access if it was written with another type.
    template<typename T>
    [[nodiscard]] const T& get(std::string_view key) const;
};

/// @brief Buffers every record in memory.
///
/// Used by tests and by callers that post-process a run.
///
/// @ingroup io_writers
/// @see TraceRecord
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const noexcept { return records_; }

    /// @brief Number of buffered records of type @p name.
    [[nodiscard]] std::size_t count(std::string_view name) const;

    /// @brief Copies of the buffered records of type @p name, in order.
    [[nodiscard]] std::vector<TraceRecord> of_type(std::string_view name) const;

    void clear() noexcept { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable log, one line per record.
///
/// @code
/// [   1.00000]  move          particle=2 from=4 to=5
/// [   1.00000]  collision     mover=3 occupant=4 outcome=blocked source=fallback
/// @endcode
///
/// The record type is left-aligned in a fixed column so that the fields of
/// consecutive records line up.
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit TextualTraceWriter(std::ostream& output);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    static constexpr int TYPE_WIDTH = 14;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::string line_;
};

template<typename T>
const T& TraceRecord::get(std::string_view key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        throw std::out_of_range("trace record has no field '" + std::string(key) + "'");
    }
    return std::get<T>(it->second);
}

} // namespace tracksim::io
