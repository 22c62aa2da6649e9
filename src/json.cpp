#include "../include/guardrail/json.hpp"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace guardrail {

namespace {

void append_utf8(std::string& out, unsigned code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

unsigned read_hex4(std::string_view text, std::size_t& pos) {
    if (pos + 4 > text.size()) {
        throw std::runtime_error("invalid unicode escape");
    }
    unsigned code = 0;
    for (int i = 0; i < 4; ++i) {
        char h = text[pos++];
        code <<= 4;
        if (h >= '0' && h <= '9') {
            code |= static_cast<unsigned>(h - '0');
        } else if (h >= 'a' && h <= 'f') {
            code |= static_cast<unsigned>(h - 'a' + 10);
        } else if (h >= 'A' && h <= 'F') {
            code |= static_cast<unsigned>(h - 'A' + 10);
        } else {
            throw std::runtime_error("invalid unicode escape");
        }
    }
    return code;
}

} // namespace

const Json* Json::find(const std::string& key) const {
    if (!is_object()) {
        return nullptr;
    }
    const auto& obj = as_object();
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->second;
}

Json* Json::find(const std::string& key) {
    if (!is_object()) {
        return nullptr;
    }
    auto& obj = as_object();
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->second;
}

void Json::dump_string(std::ostringstream& oss, const std::string& value) {
    oss << '"';
    for (char c : value) {
        switch (c) {
        case '"': oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\n': oss << "\\n"; break;
        case '\r': oss << "\\r"; break;
        case '\t': oss << "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec
                    << std::setfill(' ');
            } else {
                oss << c;
            }
        }
    }
    oss << '"';
}

void Json::dump_internal(std::ostringstream& oss) const {
    std::visit([
                   &oss](const auto& value) {
                       using T = std::decay_t<decltype(value)>;
                       if constexpr (std::is_same_v<T, std::nullptr_t>) {
                           oss << "null";
                       } else if constexpr (std::is_same_v<T, bool>) {
                           oss << (value ? "true" : "false");
                       } else if constexpr (std::is_same_v<T, double>) {
                           if (!std::isfinite(value)) {
                               oss << "null";
                           } else if (std::floor(value) == value && std::fabs(value) < 9007199254740992.0) {
                               // Integral values (ids, counts) keep their exact textual form.
                               oss << static_cast<std::int64_t>(value);
                           } else {
                               oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value
                                   << std::setprecision(6);
                           }
                       } else if constexpr (std::is_same_v<T, std::string>) {
                           dump_string(oss, value);
                       } else if constexpr (std::is_same_v<T, JsonArray>) {
                           oss << '[';
                           bool first = true;
                           for (const auto& item : value) {
                               if (!first) {
                                   oss << ',';
                               }
                               first = false;
                               item.dump_internal(oss);
                           }
                           oss << ']';
                       } else if constexpr (std::is_same_v<T, JsonObject>) {
                           oss << '{';
                           bool first = true;
                           for (const auto& [key, val] : value) {
                               if (!first) {
                                   oss << ',';
                               }
                               first = false;
                               dump_string(oss, key);
                               oss << ':';
                               val.dump_internal(oss);
                           }
                           oss << '}';
                       }
                   },
               m_value);
}

void Json::skip_ws(std::string_view text, std::size_t& pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
}

Json Json::parse(std::string_view text) {
    std::size_t pos = 0;
    skip_ws(text, pos);
    Json value = parse_value(text, pos, 0);
    skip_ws(text, pos);
    if (pos != text.size()) {
        throw std::runtime_error("unexpected trailing characters in JSON");
    }
    return value;
}

Json Json::parse_value(std::string_view text, std::size_t& pos, int depth) {
    skip_ws(text, pos);
    if (pos >= text.size()) {
        throw std::runtime_error("unexpected end of JSON");
    }
    const char c = text[pos];
    if (c == '"') {
        return parse_string(text, pos);
    }
    if (c == '[' || c == '{') {
        if (depth >= kMaxDepth) {
            throw std::runtime_error("JSON nested too deeply");
        }
        return c == '[' ? parse_array(text, pos, depth + 1) : parse_object(text, pos, depth + 1);
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') {
        std::size_t start = pos;
        ++pos;
        while (pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.' || text[pos] == 'e' || text[pos] == 'E' || text[pos] == '+' || text[pos] == '-')) {
            ++pos;
        }
        try {
            return Json(std::stod(std::string(text.substr(start, pos - start))));
        } catch (const std::logic_error&) {
            throw std::runtime_error("invalid JSON number");
        }
    }
    if (text.substr(pos, 4) == "true") {
        pos += 4;
        return Json(true);
    }
    if (text.substr(pos, 5) == "false") {
        pos += 5;
        return Json(false);
    }
    if (text.substr(pos, 4) == "null") {
        pos += 4;
        return Json(nullptr);
    }
    throw std::runtime_error("invalid JSON token");
}

Json Json::parse_string(std::string_view text, std::size_t& pos) {
    if (pos >= text.size() || text[pos] != '"') {
        throw std::runtime_error("expected string");
    }
    ++pos;
    std::string result;
    bool terminated = false;
    while (pos < text.size()) {
        char c = text[pos++];
        if (c == '"') {
            terminated = true;
            break;
        }
        if (c == '\\') {
            if (pos >= text.size()) {
                throw std::runtime_error("invalid escape");
            }
            char esc = text[pos++];
            switch (esc) {
            case '"': result.push_back('"'); break;
            case '\\': result.push_back('\\'); break;
            case '/': result.push_back('/'); break;
            case 'b': result.push_back('\b'); break;
            case 'f': result.push_back('\f'); break;
            case 'n': result.push_back('\n'); break;
            case 'r': result.push_back('\r'); break;
            case 't': result.push_back('\t'); break;
            case 'u': {
                unsigned code = read_hex4(text, pos);
                if (code >= 0xD800 && code <= 0xDBFF && pos + 6 <= text.size() && text[pos] == '\\' && text[pos + 1] == 'u') {
                    pos += 2;
                    const unsigned low = read_hex4(text, pos);
                    if (low >= 0xDC00 && low <= 0xDFFF) {
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else {
                        append_utf8(result, code);
                        code = low;
                    }
                }
                append_utf8(result, code);
                break;
            }
            default:
                throw std::runtime_error("invalid escape");
            }
        } else {
            result.push_back(c);
        }
    }
    if (!terminated) {
        throw std::runtime_error("unterminated string");
    }
    return Json(result);
}

Json Json::parse_array(std::string_view text, std::size_t& pos, int depth) {
    if (text[pos] != '[') {
        throw std::runtime_error("expected array");
    }
    ++pos;
    JsonArray arr;
    skip_ws(text, pos);
    if (pos < text.size() && text[pos] == ']') {
        ++pos;
        return Json(arr);
    }
    while (pos < text.size()) {
        arr.emplace_back(parse_value(text, pos, depth));
        skip_ws(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == ']') {
            ++pos;
            return Json(arr);
        }
        throw std::runtime_error("expected comma or closing bracket");
    }
    throw std::runtime_error("unterminated array");
}

Json Json::parse_object(std::string_view text, std::size_t& pos, int depth) {
    if (text[pos] != '{') {
        throw std::runtime_error("expected object");
    }
    ++pos;
    JsonObject obj;
    skip_ws(text, pos);
    if (pos < text.size() && text[pos] == '}') {
        ++pos;
        return Json(obj);
    }
    while (pos < text.size()) {
        skip_ws(text, pos);
        Json key = parse_string(text, pos);
        skip_ws(text, pos);
        if (pos >= text.size() || text[pos] != ':') {
            throw std::runtime_error("expected colon");
        }
        ++pos;
        obj.insert_or_assign(key.as_string(), parse_value(text, pos, depth));
        skip_ws(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == '}') {
            ++pos;
            return Json(obj);
        }
        throw std::runtime_error("expected comma or closing brace");
    }
    throw std::runtime_error("unterminated object");
}

} // namespace guardrail
