#ifndef ARGSPEC_DEFINITION_SET_HPP
#define ARGSPEC_DEFINITION_SET_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "option.hpp"

namespace argspec {

// Caller key -> option spec string, in the order options are validated and listed in help.
using Definitions = std::vector<std::pair<std::string, std::string>>;

class DefinitionSet {
public:
    using Entry = std::pair<std::string, OptionDefinition>;
    using const_iterator = std::vector<Entry>::const_iterator;

    // Parses every spec and rejects duplicated keys and flag names. Throws SettingsError.
    static DefinitionSet build(const Definitions& definitions);

    [[nodiscard]] const OptionDefinition* find(const std::string& key) const;

    // Definition owning the flag token ("-n" or "--num"), or nullptr.
    [[nodiscard]] const OptionDefinition* findByFlag(const std::string& flagToken) const;

    // Every "-s" and "--long" token, in definition order.
    [[nodiscard]] std::vector<std::string> flagTokens() const;

    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
};

} // namespace argspec

#endif // ARGSPEC_DEFINITION_SET_HPP
