#ifndef ARGSPEC_OPTION_HPP
#define ARGSPEC_OPTION_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "value.hpp"

namespace argspec {

class OptionDefinition {
public:
    explicit OptionDefinition(std::optional<char> shortFlag,
                              std::string longFlag,
                              ValueType valueType,
                              bool required,
                              OptionValue defaultValue,
                              std::string description)
        : shortFlag_(shortFlag),
          longFlag_(std::move(longFlag)),
          valueType_(valueType),
          required_(required),
          defaultValue_(std::move(defaultValue)),
          description_(std::move(description)) {}

    // Parses `[-s,]--long:type[!|=default][;description]`. Throws SettingsError.
    static OptionDefinition parse(std::string_view spec);

    [[nodiscard]] const std::optional<char>& shortFlag() const { return shortFlag_; }
    [[nodiscard]] const std::string& longFlag() const { return longFlag_; }
    [[nodiscard]] ValueType valueType() const { return valueType_; }
    [[nodiscard]] bool required() const { return required_; }
    [[nodiscard]] const OptionValue& defaultValue() const { return defaultValue_; }
    [[nodiscard]] const std::string& description() const { return description_; }

    // "-s" (empty when there is no short alias) and "--long".
    [[nodiscard]] std::string shortToken() const;
    [[nodiscard]] std::string longToken() const;
    // "-s, --long" or "--long".
    [[nodiscard]] std::string aliases() const;

    [[nodiscard]] bool hasExplicitDefault() const { return defaultValue_ != implicitDefault(valueType_); }

private:
    std::optional<char> shortFlag_;  // n
    std::string longFlag_;           // num
    ValueType valueType_;
    bool required_{false};
    OptionValue defaultValue_;       // [1,2]
    std::string description_;
};

} // namespace argspec

#endif // ARGSPEC_OPTION_HPP
