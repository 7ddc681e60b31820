#include "tfgen/flag_merger.hpp"

#include "json/json_value.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace wheels::tfgen {

namespace {

using MapEntries = std::vector<std::pair<std::string, std::string>>;

void remove_first_match(std::vector<std::string>& body, const std::string& name) {
    auto it = std::find_if(body.begin(), body.end(), [&](const std::string& line) {
        return line.find(name) != std::string::npos;
    });
    if (it != body.end()) {
        WHEELS_LOG_DEBUG("tfgen", "Replacing line '" << *it << "' for -" << name);
        body.erase(it);
    }
}

} // namespace

FlagMerger::FlagMerger(const std::set<std::string>& list_flags,
                       const std::set<std::string>& map_flags)
    : list_flags_(list_flags), map_flags_(map_flags) {}

auto FlagMerger::merge(std::vector<std::string> body,
                       const std::vector<FlagOccurrence>& supplied) const
    -> Result<std::vector<std::string>> {
    // std::map keeps block output ordered by flag name
    std::map<std::string, std::vector<std::string>> list_values;
    std::map<std::string, MapEntries> map_values;
    // Scalars in order of first occurrence, last value wins
    MapEntries scalar_values;
    std::set<std::string> visited;

    for (const auto& occ : supplied) {
        if (visited.insert(occ.name).second) {
            remove_first_match(body, occ.name);
        }

        if (list_flags_.count(occ.name)) {
            list_values[occ.name].push_back(occ.value);

        } else if (map_flags_.count(occ.name)) {
            size_t eq = occ.value.find('=');
            if (eq == std::string::npos || eq == 0) {
                return Error("could not parse '" + occ.value + "' for flag -" + occ.name +
                             ": expected key=value format");
            }

            std::string key = occ.value.substr(0, eq);
            std::string val = occ.value.substr(eq + 1);

            auto& entries = map_values[occ.name];
            auto existing = std::find_if(entries.begin(), entries.end(),
                                         [&](const auto& entry) { return entry.first == key; });
            if (existing != entries.end()) {
                existing->second = std::move(val);
            } else {
                entries.emplace_back(std::move(key), std::move(val));
            }

        } else {
            auto existing = std::find_if(scalar_values.begin(), scalar_values.end(),
                                         [&](const auto& entry) { return entry.first == occ.name; });
            if (existing != scalar_values.end()) {
                existing->second = occ.value;
            } else {
                scalar_values.emplace_back(occ.name, occ.value);
            }
        }
    }

    for (const auto& [name, value] : scalar_values) {
        body.push_back(name + " = " + json::quote(value));
    }

    for (const auto& [name, values] : list_values) {
        body.push_back("");
        body.push_back(name + " = [");
        for (const auto& item : values) {
            body.push_back("  " + json::quote(item) + ",");
        }
        body.push_back("]");
    }

    for (const auto& [name, entries] : map_values) {
        body.push_back("");
        body.push_back(name + " = {");
        for (const auto& [key, item] : entries) {
            body.push_back("  " + key + " = " + json::quote(item));
        }
        body.push_back("}");
    }

    return body;
}

} // namespace wheels::tfgen
