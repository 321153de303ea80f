#include "lateval/inclusion.h"
#include "lateval/errors.h"
#include <set>

namespace lateval {

static void checkKnown(const std::set<std::string>& known,
                       const std::vector<std::string>& requested,
                       const char* filter) {
    for (const auto& label : requested) {
        if (!known.count(label)) {
            throw ConfigurationError("Unknown component label '" + label + "' in " + filter);
        }
    }
}

std::vector<std::string> resolveInclusion(const std::vector<std::string>& labels,
                                          const std::optional<std::vector<std::string>>& include,
                                          const std::optional<std::vector<std::string>>& exclude) {
    const std::set<std::string> known(labels.begin(), labels.end());
    if (include) checkKnown(known, *include, "include");
    if (exclude) checkKnown(known, *exclude, "exclude");

    std::set<std::string> included = include ? std::set<std::string>(include->begin(), include->end()) : known;
    if (exclude) {
        for (const auto& label : *exclude) included.erase(label);
    }

    std::vector<std::string> result;
    for (const auto& label : labels) {
        if (included.count(label)) result.push_back(label);
    }
    return result;
}

}  // namespace lateval
