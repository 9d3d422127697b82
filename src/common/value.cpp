// ---------------------------------------------------------------------------
// value.cpp
//
// Value 직렬화/조회 구현.
//
// [JSON 직렬화]
// - compact 형식 (구분자 뒤 공백 없음). Validator 의 max_arg_bytes 는
//   이 직렬화 결과의 바이트 길이를 기준으로 한다.
// - NaN/Inf 는 JSON 으로 표현 불가하므로 null 로 출력한다.
// - 비 ASCII 바이트는 이스케이프하지 않고 그대로 출력 (UTF-8 가정).
// ---------------------------------------------------------------------------

#include "common/value.hpp"

#include <cmath>
#include <cstdio>
#include <string>

#include <spdlog/fmt/fmt.h>

namespace {

void append_json(std::string& out, const Value& value) {
    switch (value.kind()) {
        case ValueKind::kNull:
            out += "null";
            break;
        case ValueKind::kBool:
            out += value.as_bool() ? "true" : "false";
            break;
        case ValueKind::kInteger:
            out += std::to_string(value.as_integer());
            break;
        case ValueKind::kDouble: {
            const double d = value.as_double();
            if (!std::isfinite(d)) {
                out += "null";
            } else {
                out += fmt::format("{}", d);
            }
            break;
        }
        case ValueKind::kString:
            out += '"';
            out += escape_json_string(value.as_string());
            out += '"';
            break;
        case ValueKind::kArray: {
            out += '[';
            bool first = true;
            for (const auto& item : value.as_array()) {
                if (!first) {
                    out += ',';
                }
                first = false;
                append_json(out, item);
            }
            out += ']';
            break;
        }
        case ValueKind::kObject: {
            out += '{';
            bool first = true;
            for (const auto& [key, item] : value.as_object()) {
                if (!first) {
                    out += ',';
                }
                first = false;
                out += '"';
                out += escape_json_string(key);
                out += "\":";
                append_json(out, item);
            }
            out += '}';
            break;
        }
    }
}

}  // namespace

bool operator==(const Value& lhs, const Value& rhs) {
    return lhs.data_ == rhs.data_;
}

double Value::as_number() const {
    if (is_integer()) {
        return static_cast<double>(as_integer());
    }
    return as_double();
}

const Value* Value::find(std::string_view key) const {
    if (!is_object()) {
        return nullptr;
    }
    const auto& obj = as_object();
    const auto  it  = obj.find(std::string(key));
    if (it == obj.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string Value::to_json() const {
    std::string out;
    append_json(out, *this);
    return out;
}

std::string Value::to_display_string() const {
    if (is_string()) {
        return as_string();
    }
    return to_json();
}

std::string_view kind_to_string(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::kNull:    return "null";
        case ValueKind::kBool:    return "boolean";
        case ValueKind::kInteger: return "integer";
        case ValueKind::kDouble:  return "number";
        case ValueKind::kString:  return "string";
        case ValueKind::kArray:   return "array";
        case ValueKind::kObject:  return "object";
        default:                  return "unknown";
    }
}

// ---------------------------------------------------------------------------
// escape_json_string
//   제어 문자는 \uXXXX 로, 따옴표/역슬래시는 백슬래시 이스케이프.
// ---------------------------------------------------------------------------
std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}
