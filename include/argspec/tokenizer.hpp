#ifndef ARGSPEC_TOKENIZER_HPP
#define ARGSPEC_TOKENIZER_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "definition_set.hpp"

namespace argspec {

// One value as seen on the command line, before any type is applied.
struct RawValue {
    enum class Kind {
        Switch,   // bare flag: --flag, -f (or --no-flag)
        Number,   // numeric-looking token; `text` keeps the original spelling
        String,
        Missing,  // non-boolean flag followed by another flag or end of input
    };

    Kind kind{Kind::Missing};
    bool flag{false};
    double number{0.0};
    std::string text;
};

struct Occurrence {
    std::string flag;     // as written: "--num" or "-n"
    bool attached{false}; // --num=1, -n1
    RawValue value;
};

struct TokenizedArgs {
    std::vector<std::string> targets;
    std::unordered_map<std::string, std::vector<Occurrence>> occurrences;  // by flag token
    std::vector<std::string> unknown;                                      // with their dash prefix
    std::vector<std::string> rest;

    [[nodiscard]] const std::vector<Occurrence>& channel(const std::string& flagToken) const;
};

class Tokenizer {
public:
    struct Options {
        bool shortFlagGrouping{true}; // -abc
        bool boolNegation{false};     // --no-foo
    };

    explicit Tokenizer(const DefinitionSet& definitions) : Tokenizer(definitions, Options{}) {}
    Tokenizer(const DefinitionSet& definitions, Options options);

    [[nodiscard]] TokenizedArgs tokenize(const std::vector<std::string>& args) const;

    // Numbers are detected by shape only: 0x1f, -2, +.5, 1e3.
    static bool isNumberLike(std::string_view s);
    static RawValue detect(std::string text);

private:
    static bool isFlagToken(const std::string& s) { return s.size() >= 2 && s[0] == '-'; }

    void parseLong(const std::string& arg, std::size_t& i, const std::vector<std::string>& args, TokenizedArgs& out) const;
    void parseShortGroup(const std::string& group,
                         std::size_t& i,
                         const std::vector<std::string>& args,
                         TokenizedArgs& out) const;
    void takeValue(const std::string& key, std::size_t& i, const std::vector<std::string>& args, TokenizedArgs& out) const;
    static void skipUnknownValue(std::size_t& i, const std::vector<std::string>& args);
    static void record(TokenizedArgs& out, const std::string& key, bool attached, RawValue value);

    std::unordered_map<std::string, bool> booleans_;  // flag token -> takes no value
    Options options_;
};

} // namespace argspec

#endif // ARGSPEC_TOKENIZER_HPP
