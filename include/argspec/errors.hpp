#ifndef ARGSPEC_ERRORS_HPP
#define ARGSPEC_ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace argspec {

// A malformed option definition: the program is wrong, not its user.
class SettingsError : public std::logic_error {
public:
    explicit SettingsError(const std::string& message) : std::logic_error(message) {}
};

// The command line does not satisfy the definitions.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

// Thrown by parse() when the help option was given and no sink ended the process.
class HelpRequested : public std::exception {
public:
    explicit HelpRequested(std::string helpText) : helpText_(std::move(helpText)) {}

    [[nodiscard]] const char* what() const noexcept override { return "help requested"; }
    [[nodiscard]] const std::string& helpText() const { return helpText_; }

private:
    std::string helpText_;
};

} // namespace argspec

#endif // ARGSPEC_ERRORS_HPP
