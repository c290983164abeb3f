#include "argspec/definition_set.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "argspec/errors.hpp"
#include "argspec/utils.hpp"

namespace argspec {

DefinitionSet DefinitionSet::build(const Definitions& definitions) {
    DefinitionSet set;
    set.entries_.reserve(definitions.size());

    std::unordered_set<std::string> keys;
    for (const auto& [key, spec] : definitions) {
        if (!keys.insert(key).second) throw SettingsError("duplicated option key: " + key);
        try {
            set.entries_.emplace_back(key, OptionDefinition::parse(spec));
        } catch (const SettingsError& e) {
            throw SettingsError(key + ": " + e.what());
        }
    }

    // Short and long names share one namespace: "-a" collides with "--a".
    std::unordered_map<std::string, std::size_t> seen;
    std::vector<std::string> duplicated;
    auto note = [&](const std::string& name) {
        if (++seen[name] == 2) duplicated.push_back(name);
    };
    for (const auto& [key, def] : set.entries_) {
        if (def.shortFlag()) note(std::string(1, *def.shortFlag()));
        note(def.longFlag());
    }
    if (!duplicated.empty()) throw SettingsError("duplicated option names: " + utils::join(duplicated, ", "));

    return set;
}

const OptionDefinition* DefinitionSet::find(const std::string& key) const {
    const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

const OptionDefinition* DefinitionSet::findByFlag(const std::string& flagToken) const {
    for (const auto& [key, def] : entries_) {
        if (def.longToken() == flagToken) return &def;
        if (def.shortFlag() && def.shortToken() == flagToken) return &def;
    }
    return nullptr;
}

std::vector<std::string> DefinitionSet::flagTokens() const {
    std::vector<std::string> out;
    out.reserve(entries_.size() * 2);
    for (const auto& [key, def] : entries_) {
        if (def.shortFlag()) out.push_back(def.shortToken());
        out.push_back(def.longToken());
    }
    return out;
}

} // namespace argspec
