#ifndef ARGSPEC_HELP_HPP
#define ARGSPEC_HELP_HPP

#include <optional>
#include <string>

#include "definition_set.hpp"

namespace argspec {

// "-p, --port number" / "    --cors"; the type is omitted for booleans.
std::string formatOptionNames(const OptionDefinition& def);

// Description followed by "(required)" or "(default:<json>)".
std::string describeOption(const OptionDefinition& def);

// Usage line (when given), then one aligned line per option.
std::string formatHelp(const std::optional<std::string>& usage, const DefinitionSet& definitions);

} // namespace argspec

#endif // ARGSPEC_HELP_HPP
