#include "argspec/json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace {

using argspec::json::Literal;

struct Reader {
    const char* p{nullptr};
    const char* end{nullptr};

    static bool isWs(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

    void skipWs() {
        while (p < end && isWs(*p)) ++p;
    }

    bool consume(char c) {
        skipWs();
        if (p >= end || *p != c) return false;
        ++p;
        return true;
    }

    bool startsWith(std::string_view lit) const {
        return static_cast<std::size_t>(end - p) >= lit.size() && std::string_view(p, lit.size()) == lit;
    }

    static void appendUtf8(std::string& out, std::uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::optional<std::uint32_t> parseHex4() {
        if (end - p < 4) return std::nullopt;
        std::uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            const char ch = *p++;
            v <<= 4;
            if (ch >= '0' && ch <= '9') v |= static_cast<std::uint32_t>(ch - '0');
            else if (ch >= 'a' && ch <= 'f') v |= static_cast<std::uint32_t>(ch - 'a' + 10);
            else if (ch >= 'A' && ch <= 'F') v |= static_cast<std::uint32_t>(ch - 'A' + 10);
            else return std::nullopt;
        }
        return v;
    }

    std::optional<std::string> parseString() {
        skipWs();
        if (p >= end || *p != '"') return std::nullopt;
        ++p;
        std::string out;
        while (p < end) {
            const char ch = *p++;
            if (ch == '"') return out;
            if (static_cast<unsigned char>(ch) < 0x20) return std::nullopt;
            if (ch != '\\') {
                out.push_back(ch);
                continue;
            }
            if (p >= end) return std::nullopt;
            const char esc = *p++;
            switch (esc) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                auto cp = parseHex4();
                if (!cp) return std::nullopt;
                if (*cp >= 0xD800 && *cp <= 0xDBFF && startsWith("\\u")) {
                    const char* checkpoint = p;
                    p += 2;
                    const auto low = parseHex4();
                    if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
                        cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                    } else {
                        p = checkpoint;
                    }
                }
                appendUtf8(out, *cp);
                break;
            }
            default:
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    // Strict JSON number grammar: -?(0|[1-9]\d*)(\.\d+)?([eE][+-]?\d+)?
    std::optional<double> parseNumber() {
        skipWs();
        const char* start = p;
        if (p < end && *p == '-') ++p;
        if (p >= end || !std::isdigit(static_cast<unsigned char>(*p))) return std::nullopt;
        if (*p == '0') {
            ++p;
        } else {
            while (p < end && std::isdigit(static_cast<unsigned char>(*p))) ++p;
        }
        if (p < end && *p == '.') {
            ++p;
            if (p >= end || !std::isdigit(static_cast<unsigned char>(*p))) return std::nullopt;
            while (p < end && std::isdigit(static_cast<unsigned char>(*p))) ++p;
        }
        if (p < end && (*p == 'e' || *p == 'E')) {
            ++p;
            if (p < end && (*p == '+' || *p == '-')) ++p;
            if (p >= end || !std::isdigit(static_cast<unsigned char>(*p))) return std::nullopt;
            while (p < end && std::isdigit(static_cast<unsigned char>(*p))) ++p;
        }
        const std::string token(start, p);
        char* tokenEnd = nullptr;
        errno = 0;
        const double v = std::strtod(token.c_str(), &tokenEnd);
        if (!tokenEnd || static_cast<std::size_t>(tokenEnd - token.c_str()) != token.size()) return std::nullopt;
        if (errno == ERANGE && std::isinf(v)) return std::nullopt;
        return v;
    }

    std::optional<Literal> parseArray() {
        if (!consume('[')) return std::nullopt;
        Literal out;
        out.kind = Literal::Kind::Array;
        if (consume(']')) return out;
        while (true) {
            auto item = parseValue();
            if (!item) return std::nullopt;
            out.items.push_back(std::move(*item));
            if (consume(']')) return out;
            if (!consume(',')) return std::nullopt;
        }
    }

    std::optional<Literal> parseValue() {
        skipWs();
        if (p >= end) return std::nullopt;
        Literal out;
        if (*p == '[') return parseArray();
        if (*p == '"') {
            auto s = parseString();
            if (!s) return std::nullopt;
            out.kind = Literal::Kind::String;
            out.text = std::move(*s);
            return out;
        }
        if (*p == '-' || std::isdigit(static_cast<unsigned char>(*p))) {
            auto n = parseNumber();
            if (!n) return std::nullopt;
            out.kind = Literal::Kind::Number;
            out.number = *n;
            return out;
        }
        if (startsWith("true")) {
            p += 4;
            out.kind = Literal::Kind::Bool;
            out.boolean = true;
            return out;
        }
        if (startsWith("false")) {
            p += 5;
            out.kind = Literal::Kind::Bool;
            return out;
        }
        if (startsWith("null")) {
            p += 4;
            return out;
        }
        return std::nullopt;
    }
};

} // namespace

namespace argspec::json {

std::optional<Literal> parseLiteral(std::string_view text) {
    Reader r;
    r.p = text.data();
    r.end = text.data() + text.size();
    auto value = r.parseValue();
    if (!value) return std::nullopt;
    r.skipWs();
    if (r.p != r.end) return std::nullopt;
    return value;
}

std::string formatNumber(double value) {
    if (!std::isfinite(value)) return "null";
    if (value == 0.0) return "0";
    if (std::trunc(value) == value && std::fabs(value) < 1e21) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.0f", value);
        return buf;
    }

    char buf[40];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value) break;
    }

    // %g pads exponents ("1e-07"); JSON writers do not.
    std::string out(buf);
    const auto e = out.find('e');
    if (e == std::string::npos) return out;
    std::string mantissa = out.substr(0, e);
    std::string exponent = out.substr(e + 1);
    std::string sign;
    if (!exponent.empty() && (exponent[0] == '+' || exponent[0] == '-')) {
        sign = exponent.substr(0, 1);
        exponent.erase(0, 1);
    }
    while (exponent.size() > 1 && exponent[0] == '0') exponent.erase(0, 1);
    return mantissa + "e" + sign + exponent;
}

std::string quote(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (const char ch : s) {
        switch (ch) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                out += buf;
            } else {
                out.push_back(ch);
            }
        }
    }
    out.push_back('"');
    return out;
}

} // namespace argspec::json
