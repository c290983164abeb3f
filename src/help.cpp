#include "argspec/help.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace argspec {

std::string formatOptionNames(const OptionDefinition& def) {
    std::string names = def.shortFlag() ? def.shortToken() + ", " : std::string(4, ' ');
    names += def.longToken();
    if (def.valueType() != ValueType::Boolean) {
        names.push_back(' ');
        names += typeName(def.valueType());
    }
    return names;
}

std::string describeOption(const OptionDefinition& def) {
    std::string annotation;
    if (def.required()) {
        annotation = "(required)";
    } else if (def.hasExplicitDefault()) {
        annotation = "(default:" + toJson(def.defaultValue()) + ")";
    }

    std::string desc = def.description();
    if (!annotation.empty()) {
        if (!desc.empty()) desc.push_back(' ');
        desc += annotation;
    }
    return desc;
}

std::string formatHelp(const std::optional<std::string>& usage, const DefinitionSet& definitions) {
    std::string out;
    if (usage) out += "Usage: " + *usage + "\n";
    if (definitions.empty()) return out;
    if (usage) out += "\n";

    std::vector<std::pair<std::string, std::string>> rows;
    rows.reserve(definitions.size());
    std::size_t width = 0;
    for (const auto& [key, def] : definitions) {
        rows.emplace_back(formatOptionNames(def), describeOption(def));
        width = std::max(width, rows.back().first.size());
    }

    out += "Options:\n";
    for (const auto& [names, desc] : rows) {
        std::string line = "  " + names;
        if (!desc.empty()) {
            line.append(width - names.size(), ' ');
            line += "  " + desc;
        }
        out += line + "\n";
    }
    return out;
}

} // namespace argspec
