#include "argspec/value.hpp"

#include <type_traits>

#include "argspec/json.hpp"

namespace argspec {

std::string_view typeName(ValueType type) {
    switch (type) {
        case ValueType::Boolean: return "boolean";
        case ValueType::Number: return "number";
        case ValueType::NumberArray: return "number[]";
        case ValueType::String: return "string";
        case ValueType::StringArray: return "string[]";
    }
    return "boolean";
}

std::optional<ValueType> parseTypeName(std::string_view name) {
    if (name == "boolean") return ValueType::Boolean;
    if (name == "number") return ValueType::Number;
    if (name == "number[]") return ValueType::NumberArray;
    if (name == "string") return ValueType::String;
    if (name == "string[]") return ValueType::StringArray;
    return std::nullopt;
}

bool isArrayType(ValueType type) {
    return type == ValueType::NumberArray || type == ValueType::StringArray;
}

OptionValue implicitDefault(ValueType type) {
    switch (type) {
        case ValueType::Boolean: return false;
        case ValueType::Number: return std::monostate{};
        case ValueType::NumberArray: return std::vector<double>{};
        case ValueType::String: return std::monostate{};
        case ValueType::StringArray: return std::vector<std::string>{};
    }
    return std::monostate{};
}

bool matchesType(ValueType type, const OptionValue& value) {
    switch (type) {
        case ValueType::Boolean: return std::holds_alternative<bool>(value);
        case ValueType::Number:
            return std::holds_alternative<double>(value) || std::holds_alternative<std::monostate>(value);
        case ValueType::NumberArray: return std::holds_alternative<std::vector<double>>(value);
        case ValueType::String:
            return std::holds_alternative<std::string>(value) || std::holds_alternative<std::monostate>(value);
        case ValueType::StringArray: return std::holds_alternative<std::vector<std::string>>(value);
    }
    return false;
}

std::string toJson(const OptionValue& value) {
    return std::visit(
        [](const auto& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return x ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                return json::formatNumber(x);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return json::quote(x);
            } else if constexpr (std::is_same_v<T, std::vector<double>>) {
                std::string out = "[";
                for (std::size_t i = 0; i < x.size(); ++i) {
                    if (i) out.push_back(',');
                    out += json::formatNumber(x[i]);
                }
                return out + "]";
            } else {
                std::string out = "[";
                for (std::size_t i = 0; i < x.size(); ++i) {
                    if (i) out.push_back(',');
                    out += json::quote(x[i]);
                }
                return out + "]";
            }
        },
        value);
}

} // namespace argspec
