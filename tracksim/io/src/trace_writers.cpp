#include <tracksim/io/trace_writers.hpp>

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace tracksim::io {

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output)
    , writer_(buffer_) {
    output_ << "[\n";
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::begin(core::TimePoint time) {
    buffer_.Clear();
    writer_.Reset(buffer_);
    writer_.StartObject();
    writer_.Key("time");
    writer_.Double(core::time_to_seconds(time));
    in_record_ = true;
}

void JsonTraceWriter::key(std::string_view name) {
    writer_.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonTraceWriter::type(std::string_view name) {
    writer_.Key("type");
    writer_.String(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonTraceWriter::field(std::string_view key_name, double value) {
    key(key_name);
    writer_.Double(value);
}

void JsonTraceWriter::field(std::string_view key_name, uint64_t value) {
    key(key_name);
    writer_.Uint64(value);
}

void JsonTraceWriter::field(std::string_view key_name, int64_t value) {
    key(key_name);
    writer_.Int64(value);
}

void JsonTraceWriter::field(std::string_view key_name, std::string_view value) {
    key(key_name);
    writer_.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void JsonTraceWriter::end() {
    if (!in_record_ || finalized_) {
        return;
    }
    writer_.EndObject();
    in_record_ = false;

    output_ << (records_ == 0 ? "  " : ",\n  ") << buffer_.GetString();
    ++records_;
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    // A record interrupted by a failing step is still emitted.
    if (in_record_) {
        end();
    }
    if (records_ != 0) {
        output_ << "\n";
    }
    output_ << "]\n";
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

void MemoryTraceWriter::begin(core::TimePoint time) {
    current_ = TraceRecord{};
    current_.time = core::time_to_seconds(time);
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, int64_t value) {
    current_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields.insert_or_assign(std::string(key), std::string(value));
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(current_));
    current_ = TraceRecord{};
}

std::size_t MemoryTraceWriter::count(std::string_view name) const {
    return static_cast<std::size_t>(std::count_if(
        records_.begin(), records_.end(),
        [name](const TraceRecord& record) { return record.type == name; }));
}

std::vector<TraceRecord> MemoryTraceWriter::of_type(std::string_view name) const {
    std::vector<TraceRecord> result;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(result),
                 [name](const TraceRecord& record) { return record.type == name; });
    return result;
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

TextualTraceWriter::TextualTraceWriter(std::ostream& output)
    : output_(output) {}

void TextualTraceWriter::begin(core::TimePoint time) {
    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "[%10.5f]  ", core::time_to_seconds(time));
    line_ = stamp;
}

void TextualTraceWriter::type(std::string_view name) {
    line_.append(name);
    if (name.size() < static_cast<std::size_t>(TYPE_WIDTH)) {
        line_.append(static_cast<std::size_t>(TYPE_WIDTH) - name.size(), ' ');
    } else {
        line_.push_back(' ');
    }
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    field(key, std::string_view(oss.str()));
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    field(key, std::string_view(std::to_string(value)));
}

void TextualTraceWriter::field(std::string_view key, int64_t value) {
    field(key, std::string_view(std::to_string(value)));
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    if (!line_.empty() && line_.back() != ' ') {
        line_.push_back(' ');
    }
    line_.append(key);
    line_.push_back('=');
    line_.append(value);
}

void TextualTraceWriter::end() {
    while (!line_.empty() && line_.back() == ' ') {
        line_.pop_back();
    }
    output_ << line_ << '\n';
    line_.clear();
}

} // namespace tracksim::io
