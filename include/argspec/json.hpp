#ifndef ARGSPEC_JSON_HPP
#define ARGSPEC_JSON_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace argspec::json {

// Minimal JSON reader for option default literals: scalars and arrays, no objects.
struct Literal {
    enum class Kind {
        Null,
        Bool,
        Number,
        String,
        Array,
    };

    Kind kind{Kind::Null};
    bool boolean{false};
    double number{0.0};
    std::string text;
    std::vector<Literal> items;
};

// Parses `text` as exactly one JSON value, surrounding whitespace allowed.
std::optional<Literal> parseLiteral(std::string_view text);

// Shortest decimal form that reads back to the same double, JSON style (no NaN/Infinity: "null").
std::string formatNumber(double value);

std::string quote(std::string_view s);

} // namespace argspec::json

#endif // ARGSPEC_JSON_HPP
