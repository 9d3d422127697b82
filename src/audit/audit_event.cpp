// ---------------------------------------------------------------------------
// audit_event.cpp
//
// AuditEvent JSON 직렬화.
// 필드명은 snake_case 로 통일한다 (로그 수집기 스키마와 일치).
// ---------------------------------------------------------------------------

#include "audit/audit_event.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <spdlog/fmt/fmt.h>

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

namespace {

void append_string_field(std::ostringstream& json, const char* key, const std::string& value) {
    json << ",\"" << key << "\":\"" << escape_json_string(value) << '"';
}

void append_string_array(std::ostringstream& json, const char* key,
                         const std::vector<std::string>& values) {
    json << ",\"" << key << "\":[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            json << ',';
        }
        json << '"' << escape_json_string(values[i]) << '"';
    }
    json << ']';
}

}  // namespace

std::string AuditEvent::to_json() const {
    std::ostringstream json;
    json << "{\"timestamp\":\"" << format_iso8601(timestamp) << '"';
    append_string_field(json, "action", action);
    append_string_field(json, "tool_name", tool_name);
    append_string_field(json, "decision", decision);
    append_string_field(json, "reason", reason);
    append_string_field(json, "policy_id", policy_id);
    if (actor) {
        append_string_field(json, "actor", *actor);
    }
    if (request_id) {
        append_string_field(json, "request_id", *request_id);
    }
    json << ",\"layer\":\"" << layer_to_string(layer) << '"';
    append_string_field(json, "status", status);
    json << ",\"latency_ms\":" << fmt::format("{:.3f}", latency_ms);

    json << ",\"arguments_summary\":{\"key_count\":" << argument_count;
    append_string_array(json, "keys", argument_keys);
    json << '}';

    if (!flags.empty()) {
        append_string_array(json, "flags", flags);
    }
    if (remediation) {
        append_string_field(json, "remediation", *remediation);
    }
    if (arguments) {
        json << ",\"arguments\":" << arguments->to_json();
    }
    if (result) {
        json << ",\"result\":" << result->to_json();
    }
    json << '}';
    return json.str();
}
