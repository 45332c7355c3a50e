#include "../include/statbench/json.hpp"

#include <charconv>
#include <stdexcept>
#include <iomanip>
#include <system_error>
#include <limits>
#include <type_traits>

namespace statbench {

namespace {

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

// Lone surrogates become U+FFFD.
unsigned read_code_point(std::string_view text, std::size_t& pos) {
    constexpr unsigned kReplacement = 0xFFFD;
    const unsigned code = read_hex4(text, pos);
    if (code >= 0xDC00 && code <= 0xDFFF) {
        return kReplacement;
    }
    if (code < 0xD800 || code > 0xDBFF) {
        return code;
    }
    if (pos + 6 > text.size() || text[pos] != '\\' || text[pos + 1] != 'u') {
        return kReplacement;
    }
    std::size_t next = pos + 2;
    const unsigned low = read_hex4(text, next);
    if (low < 0xDC00 || low > 0xDFFF) {
        return kReplacement;
    }
    pos = next;
    return 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
}

} // namespace

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
                           // JSON has no representation for NaN or infinity.
                           if (value != value || value == std::numeric_limits<double>::infinity() ||
                               value == -std::numeric_limits<double>::infinity()) {
                               oss << "null";
                           } else {
                               // Shortest form that reads back to the same double.
                               char buffer[32];
                               const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
                               if (ec == std::errc()) {
                                   oss.write(buffer, end - buffer);
                               } else {
                                   const auto precision = oss.precision();
                                   oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value
                                       << std::setprecision(precision);
                               }
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
    Json value = parse_value(text, pos);
    skip_ws(text, pos);
    if (pos != text.size()) {
        throw std::runtime_error("unexpected trailing characters in JSON");
    }
    return value;
}

Json Json::parse_value(std::string_view text, std::size_t& pos) {
    skip_ws(text, pos);
    if (pos >= text.size()) {
        throw std::runtime_error("unexpected end of JSON");
    }
    const char c = text[pos];
    if (c == '"') {
        return parse_string(text, pos);
    }
    if (c == '[') {
        return parse_array(text, pos);
    }
    if (c == '{') {
        return parse_object(text, pos);
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') {
        std::size_t start = pos;
        ++pos;
        while (pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.' || text[pos] == 'e' || text[pos] == 'E' || text[pos] == '+' || text[pos] == '-')) {
            ++pos;
        }
        const std::string literal(text.substr(start, pos - start));
        std::size_t consumed = 0;
        double number = 0.0;
        try {
            number = std::stod(literal, &consumed);
        } catch (const std::exception&) {
            throw std::runtime_error("invalid JSON number: " + literal);
        }
        if (consumed != literal.size()) {
            throw std::runtime_error("invalid JSON number: " + literal);
        }
        return Json(number);
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
    bool closed = false;
    while (pos < text.size()) {
        char c = text[pos++];
        if (c == '"') {
            closed = true;
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
            case 'u':
                append_utf8(result, read_code_point(text, pos));
                break;
            default:
                throw std::runtime_error("invalid escape");
            }
        } else {
            result.push_back(c);
        }
    }
    if (!closed) {
        throw std::runtime_error("unterminated string");
    }
    return Json(result);
}

Json Json::parse_array(std::string_view text, std::size_t& pos) {
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
    while (true) {
        arr.emplace_back(parse_value(text, pos));
        skip_ws(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == ']') {
            ++pos;
            break;
        }
        throw std::runtime_error("expected comma or closing bracket");
    }
    return Json(arr);
}

Json Json::parse_object(std::string_view text, std::size_t& pos) {
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
    while (true) {
        skip_ws(text, pos);
        Json key = parse_string(text, pos);
        skip_ws(text, pos);
        if (pos >= text.size() || text[pos] != ':') {
            throw std::runtime_error("expected colon");
        }
        ++pos;
        obj.insert_or_assign(key.as_string(), parse_value(text, pos));
        skip_ws(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == '}') {
            ++pos;
            break;
        }
        throw std::runtime_error("expected comma or closing brace");
    }
    return Json(obj);
}

const Json* find_member(const JsonObject& obj, const std::string& key) {
    if (auto it = obj.find(key); it != obj.end()) {
        return &it->second;
    }
    return nullptr;
}

std::optional<std::string> find_string(const JsonObject& obj, const std::string& key) {
    if (auto it = obj.find(key); it != obj.end() && it->second.is_string()) {
        return it->second.as_string();
    }
    return std::nullopt;
}

std::optional<double> find_number(const JsonObject& obj, const std::string& key) {
    if (auto it = obj.find(key); it != obj.end() && it->second.is_number()) {
        return it->second.as_number();
    }
    return std::nullopt;
}

std::optional<bool> find_bool(const JsonObject& obj, const std::string& key) {
    if (auto it = obj.find(key); it != obj.end() && it->second.is_bool()) {
        return it->second.as_bool();
    }
    return std::nullopt;
}

} // namespace statbench
