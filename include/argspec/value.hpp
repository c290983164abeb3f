#ifndef ARGSPEC_VALUE_HPP
#define ARGSPEC_VALUE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace argspec {

enum class ValueType {
    Boolean,
    Number,
    NumberArray,
    String,
    StringArray,
};

// Runtime-typed option value. std::monostate is null and only appears for Number and String.
using OptionValue = std::variant<std::monostate, bool, double, std::string, std::vector<double>, std::vector<std::string>>;

// "boolean", "number", "number[]", "string", "string[]".
std::string_view typeName(ValueType type);
std::optional<ValueType> parseTypeName(std::string_view name);

bool isArrayType(ValueType type);

// false for Boolean, null for Number/String, empty sequence for arrays.
OptionValue implicitDefault(ValueType type);

// True when `value` holds the alternative that `type` resolves to (null allowed for Number/String).
bool matchesType(ValueType type, const OptionValue& value);

// JSON rendering: null, true, 42, "text", [1,2], ["a","b"].
std::string toJson(const OptionValue& value);

} // namespace argspec

#endif // ARGSPEC_VALUE_HPP
