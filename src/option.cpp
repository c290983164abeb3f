#include "argspec/option.hpp"

#include <cctype>

#include "argspec/default_value.hpp"
#include "argspec/errors.hpp"
#include "argspec/utils.hpp"

namespace {

struct Scanner {
    std::string_view src;
    std::size_t pos{0};

    bool atEnd() const { return pos >= src.size(); }
    char peek(std::size_t ahead = 0) const { return pos + ahead < src.size() ? src[pos + ahead] : '\0'; }

    void skipWs() {
        while (!atEnd() && std::isspace(static_cast<unsigned char>(src[pos]))) ++pos;
    }

    bool consume(char c) {
        skipWs();
        if (atEnd() || src[pos] != c) return false;
        ++pos;
        return true;
    }

    template <typename Pred>
    std::string_view readWhile(Pred pred) {
        const std::size_t start = pos;
        while (!atEnd() && pred(src[pos])) ++pos;
        return src.substr(start, pos - start);
    }

    // Raw text of a default literal: up to the first ';' outside a JSON string.
    std::string_view scanLiteral() {
        const std::size_t start = pos;
        bool inString = false;
        while (!atEnd()) {
            const char ch = src[pos];
            if (inString) {
                if (ch == '\\' && pos + 1 < src.size()) {
                    pos += 2;
                    continue;
                }
                if (ch == '"') inString = false;
            } else if (ch == '"') {
                inString = true;
            } else if (ch == ';') {
                break;
            }
            ++pos;
        }
        return src.substr(start, pos - start);
    }
};

[[noreturn]] static void syntaxError(std::string_view spec, const std::string& detail) {
    throw argspec::SettingsError("syntax error in option definition \"" + std::string(spec) + "\": " + detail);
}

} // namespace

namespace argspec {

OptionDefinition OptionDefinition::parse(std::string_view spec) {
    Scanner s{spec};

    std::optional<char> shortFlag;
    s.skipWs();
    if (s.peek() == '-' && s.peek(1) != '-') {
        ++s.pos;
        s.skipWs();
        const char c = s.peek();
        if (!utils::isAlnum(c)) syntaxError(spec, "a short flag must be a single alphanumeric character");
        ++s.pos;
        shortFlag = c;
        if (!s.consume(',')) syntaxError(spec, "expected ',' after -" + std::string(1, c));
        s.skipWs();
    }

    if (s.peek() != '-' || s.peek(1) != '-') syntaxError(spec, "expected a long flag starting with --");
    s.pos += 2;
    const std::string longFlag(s.readWhile(utils::isAlnum));
    if (longFlag.empty()) syntaxError(spec, "a long flag needs at least one alphanumeric character");

    if (!s.consume(':')) syntaxError(spec, "expected ':' after --" + longFlag);
    s.skipWs();
    std::string typeWord(s.readWhile([](char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }));
    if (typeWord.empty()) syntaxError(spec, "expected a type after --" + longFlag + ":");
    if (s.consume('[')) {
        if (!s.consume(']')) syntaxError(spec, "expected ']' after " + typeWord + "[");
        typeWord += "[]";
    }
    const auto valueType = parseTypeName(typeWord);
    if (!valueType) throw SettingsError("unknown type: " + typeWord);

    bool required = false;
    OptionValue defaultValue = implicitDefault(*valueType);
    if (s.consume('!')) {
        required = true;
        if (s.consume('=')) {
            throw SettingsError("--" + longFlag + " cannot be both required and have a default value");
        }
    } else if (s.consume('=')) {
        defaultValue = resolveDefault(*valueType, s.scanLiteral(), longFlag);
    }

    std::string description;
    s.skipWs();
    if (s.consume(';')) {
        description = std::string(utils::trimWs(s.src.substr(s.pos)));
    } else if (!s.atEnd()) {
        syntaxError(spec, std::string("unexpected '") + s.peek() + "'");
    }

    return OptionDefinition(shortFlag, longFlag, *valueType, required, std::move(defaultValue), std::move(description));
}

std::string OptionDefinition::shortToken() const {
    if (!shortFlag_) return {};
    return std::string("-") + *shortFlag_;
}

std::string OptionDefinition::longToken() const { return "--" + longFlag_; }

std::string OptionDefinition::aliases() const {
    if (!shortFlag_) return longToken();
    return shortToken() + ", " + longToken();
}

} // namespace argspec
