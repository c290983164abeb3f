#include "argspec/validator.hpp"

#include "argspec/errors.hpp"
#include "argspec/json.hpp"
#include "argspec/utils.hpp"

namespace argspec {

std::vector<Occurrence> Validator::collect(const OptionDefinition& def) const {
    std::vector<Occurrence> out = args_.channel(def.longToken());
    if (def.shortFlag()) {
        const auto& shortValues = args_.channel(def.shortToken());
        out.insert(out.end(), shortValues.begin(), shortValues.end());
    }
    return out;
}

OptionValue Validator::resolve(const OptionDefinition& def) const {
    const auto values = collect(def);
    const auto aliases = def.aliases();
    const auto type = def.valueType();

    if (type == ValueType::Boolean) {
        for (const auto& o : values) {
            if (o.attached) {
                throw ValidationError(o.flag + " is a boolean switch and must not have a value (got " +
                                      json::quote(o.value.text) + ")");
            }
        }
    }

    if (values.empty()) {
        const auto& fallback = def.defaultValue();
        if (def.required() && std::holds_alternative<std::monostate>(fallback)) {
            throw ValidationError(aliases + " is required");
        }
        return fallback;
    }

    for (const auto& o : values) {
        if (o.value.kind == RawValue::Kind::Missing) throw ValidationError(o.flag + " needs a value");
    }

    switch (type) {
        case ValueType::Boolean:
            if (values.size() > 1) throw ValidationError(aliases + " should not have multiple values");
            return values.front().value.flag;
        case ValueType::Number: {
            if (values.size() > 1) throw ValidationError(aliases + " should not have multiple values");
            const auto& v = values.front().value;
            if (v.kind != RawValue::Kind::Number) {
                throw ValidationError(aliases + " should be a number (got " + json::quote(v.text) + ")");
            }
            return v.number;
        }
        case ValueType::NumberArray: {
            std::vector<double> out;
            out.reserve(values.size());
            for (const auto& o : values) {
                if (o.value.kind != RawValue::Kind::Number) {
                    throw ValidationError("all values of " + aliases + " should be numbers (got " +
                                          json::quote(o.value.text) + ")");
                }
                out.push_back(o.value.number);
            }
            return out;
        }
        case ValueType::String:
            if (values.size() > 1) throw ValidationError(aliases + " should not have multiple values");
            // Numeric-looking tokens go back to the text the user typed.
            return values.front().value.text;
        case ValueType::StringArray: {
            std::vector<std::string> out;
            out.reserve(values.size());
            for (const auto& o : values) out.push_back(o.value.text);
            return out;
        }
    }
    return std::monostate{};
}

bool Validator::isSwitchedOn(const OptionDefinition& def) const {
    if (def.valueType() != ValueType::Boolean) return false;
    const auto values = collect(def);
    if (values.empty()) {
        const auto* on = std::get_if<bool>(&def.defaultValue());
        return on != nullptr && *on;
    }
    if (values.size() != 1 || values.front().attached) return false;
    return values.front().value.flag;
}

void Validator::checkUnknown() const {
    if (args_.unknown.empty()) return;
    const auto& token = args_.unknown.front();
    std::string message = "unknown option: " + token;
    if (options_.suggestOptions) {
        const auto suggestions =
            utils::suggest(token, definitions_.flagTokens(), /*maxResults=*/3, options_.suggestionsMinimumDistance);
        if (!suggestions.empty()) {
            message += "\n\nDid you mean this?";
            for (const auto& s : suggestions) message += "\n  " + s;
        }
    }
    throw ValidationError(message);
}

Validator::Resolved Validator::validate() const {
    Resolved out;
    out.reserve(definitions_.size());
    for (const auto& [key, def] : definitions_) {
        out.emplace_back(key, resolve(def));
    }
    if (!options_.allowUnknownOptions) checkUnknown();
    if (options_.requireTarget.enabled() && args_.targets.empty()) {
        throw ValidationError(options_.requireTarget.message());
    }
    return out;
}

} // namespace argspec
