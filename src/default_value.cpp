#include "argspec/default_value.hpp"

#include <optional>
#include <vector>

#include "argspec/errors.hpp"
#include "argspec/json.hpp"
#include "argspec/utils.hpp"

namespace {

using argspec::json::Literal;

static std::optional<argspec::OptionValue> fromLiteral(argspec::ValueType type, const Literal& lit) {
    using argspec::ValueType;
    switch (type) {
        case ValueType::Boolean:
            if (lit.kind != Literal::Kind::Bool) return std::nullopt;
            return lit.boolean;
        case ValueType::Number:
            if (lit.kind != Literal::Kind::Number) return std::nullopt;
            return lit.number;
        case ValueType::String:
            if (lit.kind != Literal::Kind::String) return std::nullopt;
            return lit.text;
        case ValueType::NumberArray: {
            if (lit.kind != Literal::Kind::Array) return std::nullopt;
            std::vector<double> out;
            out.reserve(lit.items.size());
            for (const auto& item : lit.items) {
                if (item.kind != Literal::Kind::Number) return std::nullopt;
                out.push_back(item.number);
            }
            return out;
        }
        case ValueType::StringArray: {
            if (lit.kind != Literal::Kind::Array) return std::nullopt;
            std::vector<std::string> out;
            out.reserve(lit.items.size());
            for (const auto& item : lit.items) {
                if (item.kind != Literal::Kind::String) return std::nullopt;
                out.push_back(item.text);
            }
            return out;
        }
    }
    return std::nullopt;
}

static std::string expectedShape(argspec::ValueType type) {
    using argspec::ValueType;
    switch (type) {
        case ValueType::Boolean: return "a boolean";
        case ValueType::Number: return "a number";
        case ValueType::NumberArray: return "an array of numbers";
        case ValueType::String: return "a string";
        case ValueType::StringArray: return "an array of strings";
    }
    return "a value";
}

} // namespace

namespace argspec {

OptionValue resolveDefault(ValueType type, std::string_view literal, const std::string& longFlag) {
    const auto text = utils::trimWs(literal);
    const auto lit = json::parseLiteral(text);
    if (!lit) {
        throw SettingsError("the default value of --" + longFlag + " is not a valid JSON literal: " + std::string(text));
    }
    auto value = fromLiteral(type, *lit);
    if (!value) {
        throw SettingsError("the default value of --" + longFlag + " should be " + expectedShape(type) + ": " +
                            std::string(text));
    }
    return std::move(*value);
}

} // namespace argspec
