// ---------------------------------------------------------------------------
// canonical.cpp
//
// 정규화 JSON 직렬화 구현.
// 이스케이프 규칙은 구조화 로거와 공유한다 (로그 JSON 과 해시 입력의 일관성).
// ---------------------------------------------------------------------------

#include "common/canonical.hpp"

#include <cmath>
#include <cstdio>
#include <string>
#include <type_traits>
#include <variant>

#include <spdlog/fmt/fmt.h>

namespace {

// double 직렬화.
// fmt 의 기본 표현은 최단 왕복 표현이지만 2.0 → "2" 처럼 정수와 구분되지 않으므로
// 소수점/지수 표기가 없으면 ".0" 을 붙인다. int64 2 와 double 2.0 의 해시를 구분하기 위함.
std::string format_double(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::string out = fmt::format("{}", value);
    if (out.find_first_of(".eE") == std::string::npos) {
        out += ".0";
    }
    return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// escape_json_string
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

std::string canonical_json(const ScalarValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_double(v);
        } else {
            return "\"" + escape_json_string(v) + "\"";
        }
    }, value);
}

std::string canonical_json(const std::map<std::string, ScalarValue>& object) {
    std::string out{"{"};
    bool first = true;
    for (const auto& [key, value] : object) {
        if (!first) {
            out += ',';
        }
        first = false;
        out += '"';
        out += escape_json_string(key);
        out += "\":";
        out += canonical_json(value);
    }
    out += '}';
    return out;
}

std::string canonical_json(const QueryResult& result) {
    // 키 사전순: bytes_scanned < rows
    std::string out = fmt::format(R"({{"bytes_scanned":{},"rows":[)", result.bytes_scanned);
    for (std::size_t i = 0; i < result.rows.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += canonical_json(result.rows[i]);
    }
    out += "]}";
    return out;
}
