#ifndef ARGSPEC_VALIDATOR_HPP
#define ARGSPEC_VALIDATOR_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "definition_set.hpp"
#include "tokenizer.hpp"
#include "value.hpp"

namespace argspec {

// Whether at least one target (positional token before `--`) must be given.
class RequireTarget {
public:
    static RequireTarget off() { return RequireTarget(false, std::nullopt); }
    static RequireTarget on() { return RequireTarget(true, std::nullopt); }
    static RequireTarget on(std::string message) { return RequireTarget(true, std::move(message)); }

    [[nodiscard]] bool enabled() const { return enabled_; }
    [[nodiscard]] std::string message() const { return message_.value_or("a target is required"); }

private:
    RequireTarget(bool enabled, std::optional<std::string> message) : enabled_(enabled), message_(std::move(message)) {}

    bool enabled_{false};
    std::optional<std::string> message_;
};

class Validator {
public:
    struct Options {
        RequireTarget requireTarget{RequireTarget::off()};
        bool allowUnknownOptions{false};
        bool suggestOptions{true};
        std::size_t suggestionsMinimumDistance{2};
    };

    using Resolved = std::vector<std::pair<std::string, OptionValue>>;

    Validator(const DefinitionSet& definitions, const TokenizedArgs& args) : Validator(definitions, args, Options{}) {}
    Validator(const DefinitionSet& definitions, const TokenizedArgs& args, Options options)
        : definitions_(definitions), args_(args), options_(std::move(options)) {}

    // Resolves every option in definition order, then checks unknown flags and targets.
    // Throws ValidationError on the first violation.
    [[nodiscard]] Resolved validate() const;

    // Value of one option: long-channel occurrences first, then short-channel ones.
    [[nodiscard]] OptionValue resolve(const OptionDefinition& def) const;

    // True when the boolean option `def` was switched on (or defaults to on) without any misuse.
    [[nodiscard]] bool isSwitchedOn(const OptionDefinition& def) const;

private:
    [[nodiscard]] std::vector<Occurrence> collect(const OptionDefinition& def) const;
    void checkUnknown() const;

    const DefinitionSet& definitions_;
    const TokenizedArgs& args_;
    Options options_;
};

} // namespace argspec

#endif // ARGSPEC_VALIDATOR_HPP
