#include "argspec/tokenizer.hpp"

#include <cctype>
#include <cstdlib>
#include <utility>

namespace {

static bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

static bool isWordChar(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

static bool isHexLiteral(std::string_view s) {
    if (s.size() < 3 || s[0] != '0' || (s[1] != 'x' && s[1] != 'X')) return false;
    for (std::size_t i = 2; i < s.size(); ++i) {
        if (std::isxdigit(static_cast<unsigned char>(s[i])) == 0) return false;
    }
    return true;
}

} // namespace

namespace argspec {

const std::vector<Occurrence>& TokenizedArgs::channel(const std::string& flagToken) const {
    static const std::vector<Occurrence> none;
    const auto it = occurrences.find(flagToken);
    return it == occurrences.end() ? none : it->second;
}

Tokenizer::Tokenizer(const DefinitionSet& definitions, Options options) : options_(options) {
    for (const auto& [key, def] : definitions) {
        const bool isBool = def.valueType() == ValueType::Boolean;
        booleans_[def.longToken()] = isBool;
        if (def.shortFlag()) booleans_[def.shortToken()] = isBool;
    }
}

TokenizedArgs Tokenizer::tokenize(const std::vector<std::string>& args) const {
    TokenizedArgs out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--") {
            out.rest.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
            break;
        }
        if (!isFlagToken(arg)) {
            out.targets.push_back(arg);
            continue;
        }
        if (arg.rfind("--", 0) == 0) {
            parseLong(arg, i, args, out);
        } else {
            parseShortGroup(arg, i, args, out);
        }
    }
    return out;
}

bool Tokenizer::isNumberLike(std::string_view s) {
    if (isHexLiteral(s)) return true;

    std::size_t pos = 0;
    if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) ++pos;
    bool digits = false;
    while (pos < s.size() && isDigit(s[pos])) {
        digits = true;
        ++pos;
    }
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        while (pos < s.size() && isDigit(s[pos])) {
            digits = true;
            ++pos;
        }
    }
    if (!digits) return false;
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        ++pos;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) ++pos;
        bool expDigits = false;
        while (pos < s.size() && isDigit(s[pos])) {
            expDigits = true;
            ++pos;
        }
        if (!expDigits) return false;
    }
    return pos == s.size();
}

RawValue Tokenizer::detect(std::string text) {
    RawValue v;
    if (isNumberLike(text)) {
        v.kind = RawValue::Kind::Number;
        if (isHexLiteral(text)) {
            v.number = static_cast<double>(std::strtoull(text.c_str() + 2, nullptr, 16));
        } else {
            v.number = std::strtod(text.c_str(), nullptr);
        }
    } else {
        v.kind = RawValue::Kind::String;
    }
    v.text = std::move(text);
    return v;
}

void Tokenizer::parseLong(const std::string& arg,
                          std::size_t& i,
                          const std::vector<std::string>& args,
                          TokenizedArgs& out) const {
    const auto eq = arg.find('=');
    if (eq != std::string::npos) {
        const std::string key = arg.substr(0, eq);
        if (booleans_.find(key) == booleans_.end()) {
            out.unknown.push_back(key);
            return;
        }
        record(out, key, /*attached=*/true, detect(arg.substr(eq + 1)));
        return;
    }

    if (options_.boolNegation && arg.rfind("--no-", 0) == 0) {
        const std::string base = "--" + arg.substr(5);
        const auto it = booleans_.find(base);
        if (it != booleans_.end() && it->second) {
            RawValue off;
            off.kind = RawValue::Kind::Switch;
            off.flag = false;
            record(out, base, /*attached=*/false, std::move(off));
            return;
        }
    }

    const auto it = booleans_.find(arg);
    if (it == booleans_.end()) {
        out.unknown.push_back(arg);
        skipUnknownValue(i, args);
        return;
    }
    if (it->second) {
        RawValue on;
        on.kind = RawValue::Kind::Switch;
        on.flag = true;
        record(out, arg, /*attached=*/false, std::move(on));
        return;
    }
    takeValue(arg, i, args, out);
}

void Tokenizer::parseShortGroup(const std::string& group,
                                std::size_t& i,
                                const std::vector<std::string>& args,
                                TokenizedArgs& out) const {
    for (std::size_t pos = 1; pos < group.size(); ++pos) {
        const std::string key = std::string("-") + group[pos];
        const std::string remainder = group.substr(pos + 1);
        const auto it = booleans_.find(key);
        if (it == booleans_.end()) {
            out.unknown.push_back(key);
            if (remainder.empty()) skipUnknownValue(i, args);
            return;
        }

        if (it->second) {
            if (remainder.empty()) {
                RawValue on;
                on.kind = RawValue::Kind::Switch;
                on.flag = true;
                record(out, key, /*attached=*/false, std::move(on));
                return;
            }
            // -a=x, -a1 and -a/ carry a value; -ab continues the group.
            if (remainder[0] == '=' || isNumberLike(remainder) || !isWordChar(remainder[0]) ||
                !options_.shortFlagGrouping) {
                record(out, key, /*attached=*/true, detect(remainder[0] == '=' ? remainder.substr(1) : remainder));
                return;
            }
            RawValue on;
            on.kind = RawValue::Kind::Switch;
            on.flag = true;
            record(out, key, /*attached=*/false, std::move(on));
            continue;
        }

        // Needs a value: -nvalue, -n=value or -n value
        if (!remainder.empty()) {
            record(out, key, /*attached=*/true, detect(remainder[0] == '=' ? remainder.substr(1) : remainder));
            return;
        }
        takeValue(key, i, args, out);
        return;
    }
}

void Tokenizer::takeValue(const std::string& key,
                          std::size_t& i,
                          const std::vector<std::string>& args,
                          TokenizedArgs& out) const {
    if (i + 1 < args.size() && !isFlagToken(args[i + 1])) {
        record(out, key, /*attached=*/false, detect(args[++i]));
        return;
    }
    record(out, key, /*attached=*/false, RawValue{});
}

void Tokenizer::skipUnknownValue(std::size_t& i, const std::vector<std::string>& args) {
    if (i + 1 < args.size() && !isFlagToken(args[i + 1])) ++i;
}

void Tokenizer::record(TokenizedArgs& out, const std::string& key, bool attached, RawValue value) {
    out.occurrences[key].push_back(Occurrence{key, attached, std::move(value)});
}

} // namespace argspec
