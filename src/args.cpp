#include "argspec/args.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "argspec/help.hpp"
#include "argspec/tokenizer.hpp"

namespace argspec {

void ExitSink::terminate(int status, const std::string& text) {
    std::ostream& os = status == 0 ? out_ : err_;
    os << text;
    if (!text.empty() && text.back() != '\n') os << "\n";
    os.flush();
    std::exit(status);
}

const OptionValue& OptionValues::at(const std::string& key) const {
    const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == key; });
    if (it == entries_.end()) throw std::out_of_range("no option defined for key: " + key);
    return it->second;
}

bool OptionValues::contains(const std::string& key) const {
    return std::any_of(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == key; });
}

ParseResult parse(const std::vector<std::string>& tokens, const Definitions& definitions, const Config& config) {
    const auto set = DefinitionSet::build(definitions);

    Tokenizer::Options tokenizerOptions;
    tokenizerOptions.shortFlagGrouping = config.shortFlagGrouping;
    tokenizerOptions.boolNegation = config.boolNegation;
    const auto args = Tokenizer(set, tokenizerOptions).tokenize(tokens);

    Validator::Options validatorOptions;
    validatorOptions.requireTarget = config.requireTarget;
    validatorOptions.allowUnknownOptions = config.allowUnknownOptions;
    validatorOptions.suggestOptions = config.suggestOptions;
    const Validator validator(set, args, validatorOptions);

    std::shared_ptr<FailureSink> sink = config.sink;
    if (!sink) {
        sink = std::make_shared<ExitSink>(config.out ? *config.out : std::cout, config.err ? *config.err : std::cerr);
    }
    const std::string helpText = formatHelp(config.usage, set);

    if (config.handleHelpFlag) {
        const auto* help = set.find("help");
        if (help && validator.isSwitchedOn(*help)) {
            if (config.exitOnProcessError) sink->terminate(0, helpText);
            throw HelpRequested(helpText);
        }
    }

    Validator::Resolved resolved;
    try {
        resolved = validator.validate();
    } catch (const ValidationError& e) {
        if (config.exitOnProcessError) {
            std::string text = "Error: " + std::string(e.what()) + "\n";
            if (!helpText.empty()) text += "\n" + helpText;
            sink->terminate(1, text);
        }
        throw;
    }

    return ParseResult{args.targets, OptionValues(std::move(resolved)), args.rest, HelpPrinter(helpText, sink)};
}

ParseResult parse(int argc, char** argv, const Definitions& definitions, const Config& config) {
    std::vector<std::string> tokens;
    tokens.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
    for (int i = 1; i < argc; ++i) tokens.emplace_back(argv[i]);
    return parse(tokens, definitions, config);
}

} // namespace argspec
