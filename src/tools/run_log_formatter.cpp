#include "ibshrink/tools/run_log_formatter.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

void append_json_string(std::string& out, const std::string& text)
{
    out.push_back('"');
    for (unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

}  // namespace

namespace ibshrink::tools {

std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
    gmtime_r(&time_value, &buffer);

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

std::string format_run_event_json(const ibshrink::orchestrator::RunEvent& event)
{
    std::string json;
    json.reserve(256U);
    json.push_back('{');
    bool first = true;

    auto append_field = [&](const char* name) {
        if (!first) {
            json.push_back(',');
        }
        first = false;
        json.push_back('"');
        json.append(name);
        json.push_back('"');
        json.push_back(':');
    };

    auto append_string_field = [&](const char* name, const std::string& value) {
        append_field(name);
        append_json_string(json, value);
    };

    auto append_optional_string_field = [&](const char* name, const std::string& value) {
        append_field(name);
        if (value.empty()) {
            json.append("null");
        } else {
            append_json_string(json, value);
        }
    };

    auto append_number_field = [&](const char* name, auto value) {
        append_field(name);
        json.append(std::to_string(value));
    };

    auto append_bool_field = [&](const char* name, bool value) {
        append_field(name);
        json.append(value ? "true" : "false");
    };

    append_optional_string_field("timestamp", format_timestamp_iso(event.timestamp));
    append_string_field("profile", event.profile);
    append_number_field("stage", event.stage);
    append_string_field("phase", event.phase);
    append_optional_string_field("schema", event.schema);
    append_optional_string_field("table", event.table);
    append_string_field("step", event.step);
    append_bool_field("success", event.success);
    append_optional_string_field("error", event.error);
    append_string_field("message", event.message);
    append_number_field("duration_ms", event.duration_ms);
    append_number_field("bytes", event.bytes);

    json.push_back('}');
    return json;
}

}  // namespace ibshrink::tools
