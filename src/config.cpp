#include "lateval/config.h"
#include "lateval/errors.h"
#include "lateval/predictor.h"
#include "lateval/state.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace lateval {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static bool parseBool(const std::string& key, const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    throw ConfigurationError("Invalid boolean for '" + key + "': " + value);
}

static uint64_t parseUnsigned(const std::string& key, const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigurationError("Invalid non-negative integer for '" + key + "': " + value);
    }
    std::istringstream iss(value);
    uint64_t result = 0;
    iss >> result;
    if (iss.fail()) {
        throw ConfigurationError("Invalid non-negative integer for '" + key + "': " + value);
    }
    return result;
}

static std::vector<std::string> parseLabels(const std::string& value) {
    std::vector<std::string> labels;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) labels.push_back(item);
    }
    return labels;
}

bool loadEvaluationOptionsFromFile(const std::string& path, EvaluationOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigurationError(path + ":" + std::to_string(lineNumber) + ": expected key = value");
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "property") {
            StateProperty::parse(value);
            options.property = value;
        } else if (key == "samples") {
            options.samples = static_cast<size_t>(parseUnsigned(key, value));
        } else if (key == "seed") {
            options.seed = parseUnsigned(key, value);
        } else if (key == "numThreads") {
            options.numThreads = value;
        } else if (key == "internalHyperpar") {
            options.internalHyperpar = parseBool(key, value);
        } else if (key == "format") {
            options.format = outputFormatToString(parseOutputFormat(value));
        } else if (key == "include") {
            options.include = parseLabels(value);
        } else if (key == "exclude") {
            options.exclude = parseLabels(value);
        } else if (key == "verbose") {
            options.verbose = parseBool(key, value);
        } else {
            throw ConfigurationError(path + ":" + std::to_string(lineNumber) + ": unknown option '" + key + "'");
        }
    }
    return true;
}

}  // namespace lateval
