#ifndef ARGSPEC_ARGS_HPP
#define ARGSPEC_ARGS_HPP

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "definition_set.hpp"
#include "errors.hpp"
#include "validator.hpp"
#include "value.hpp"

namespace argspec {

// Terminal action for help requests (status 0) and validation failures (status 1).
// Implementations normally do not return; if one does, parse() throws instead of returning options.
class FailureSink {
public:
    virtual ~FailureSink() = default;
    virtual void terminate(int status, const std::string& text) = 0;
};

// Writes to `out` for status 0 and to `err` otherwise, then calls std::exit(status).
class ExitSink : public FailureSink {
public:
    ExitSink(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

    void terminate(int status, const std::string& text) override;

private:
    std::ostream& out_;
    std::ostream& err_;
};

struct Config {
    std::optional<std::string> usage;
    // Route validation errors and help through the sink instead of throwing them.
    bool exitOnProcessError{true};
    // A boolean option keyed "help" that is switched on prints help instead of returning options.
    bool handleHelpFlag{true};
    RequireTarget requireTarget{RequireTarget::off()};
    bool allowUnknownOptions{false};
    bool shortFlagGrouping{true};
    bool boolNegation{false};
    bool suggestOptions{true};
    // Overrides the default ExitSink; shared with ParseResult::help.
    std::shared_ptr<FailureSink> sink;
    // Streams for the default ExitSink (std::cout / std::cerr when null); must outlive the ParseResult.
    std::ostream* out{nullptr};
    std::ostream* err{nullptr};
};

// Help text of the definitions that were just parsed.
class HelpPrinter {
public:
    HelpPrinter(std::string text, std::shared_ptr<FailureSink> sink) : text_(std::move(text)), sink_(std::move(sink)) {}

    // Returns the help text, no side effects.
    std::string operator()() const { return text_; }
    // Writes the help text and terminates with `status` through the sink.
    void operator()(int status) const { sink_->terminate(status, text_); }

    [[nodiscard]] const std::string& text() const { return text_; }

private:
    std::string text_;
    std::shared_ptr<FailureSink> sink_;
};

// Resolved option values by caller key, in definition order.
// Number and String options hold std::monostate when absent; see ValueType for the other alternatives.
class OptionValues {
public:
    using Entry = std::pair<std::string, OptionValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    OptionValues() = default;
    explicit OptionValues(std::vector<Entry> entries) : entries_(std::move(entries)) {}

    // Throws std::out_of_range for keys that were not defined.
    [[nodiscard]] const OptionValue& at(const std::string& key) const;

    // Throws std::bad_variant_access when `key` does not hold a T.
    template <typename T>
    [[nodiscard]] const T& get(const std::string& key) const {
        return std::get<T>(at(key));
    }

    [[nodiscard]] bool isNull(const std::string& key) const { return std::holds_alternative<std::monostate>(at(key)); }
    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const { return entries_.end(); }

    friend bool operator==(const OptionValues& a, const OptionValues& b) { return a.entries_ == b.entries_; }
    friend bool operator!=(const OptionValues& a, const OptionValues& b) { return !(a == b); }

private:
    std::vector<Entry> entries_;
};

struct ParseResult {
    std::vector<std::string> targets;
    OptionValues options;
    std::vector<std::string> rest;
    HelpPrinter help;
};

// Builds the definitions (SettingsError is always thrown), tokenizes `tokens` and validates them.
ParseResult parse(const std::vector<std::string>& tokens, const Definitions& definitions, const Config& config = {});

// Same, skipping argv[0].
ParseResult parse(int argc, char** argv, const Definitions& definitions, const Config& config = {});

} // namespace argspec

#endif // ARGSPEC_ARGS_HPP
