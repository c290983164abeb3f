#ifndef ARGSPEC_DEFAULT_VALUE_HPP
#define ARGSPEC_DEFAULT_VALUE_HPP

#include <string>
#include <string_view>

#include "value.hpp"

namespace argspec {

// Decodes the JSON literal of a `=default` clause and checks it against `type`.
// Throws SettingsError naming `longFlag` when the literal is malformed or has the wrong shape.
OptionValue resolveDefault(ValueType type, std::string_view literal, const std::string& longFlag);

} // namespace argspec

#endif // ARGSPEC_DEFAULT_VALUE_HPP
