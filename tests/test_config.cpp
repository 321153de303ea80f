/**
 * Tests for option file loading (loadEvaluationOptionsFromFile).
 */

#include <catch2/catch_test_macros.hpp>
#include "lateval/config.h"
#include "lateval/errors.h"
#include "lateval/predictor.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static fs::path writeConfig(const std::string& name, const std::string& contents) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream f(path);
    f << contents;
    return path;
}

TEST_CASE("Load non-existent config returns false", "[config]") {
    lateval::EvaluationOptions options;
    bool loaded = lateval::loadEvaluationOptionsFromFile("/nonexistent/lateval.conf", options);
    REQUIRE_FALSE(loaded);
}

TEST_CASE("Comment-only config keeps defaults", "[config]") {
    fs::path configPath = writeConfig("lateval_test_comments.conf", "# nothing here\n\n   # indented comment\n");
    lateval::EvaluationOptions options;
    bool loaded = lateval::loadEvaluationOptionsFromFile(configPath.string(), options);
    fs::remove(configPath);
    REQUIRE(loaded);
    REQUIRE(options.property == "mode");
    REQUIRE(options.samples == 100);
    REQUIRE(options.format == "auto");
    REQUIRE_FALSE(options.include.has_value());
}

TEST_CASE("Config file options are applied", "[config]") {
    fs::path configPath = writeConfig("lateval_test_config.conf",
                                      "# test\n"
                                      "property = sample\n"
                                      "samples = 250\n"
                                      "seed = 17\n"
                                      "numThreads = 4:1\n"
                                      "internalHyperpar = yes\n"
                                      "format = matrix\n"
                                      "include = intercept, x ,u\n"
                                      "exclude = u\n"
                                      "verbose = true\n");
    lateval::EvaluationOptions options;
    bool loaded = lateval::loadEvaluationOptionsFromFile(configPath.string(), options);
    fs::remove(configPath);
    REQUIRE(loaded);
    REQUIRE(options.property == "sample");
    REQUIRE(options.samples == 250);
    REQUIRE(options.seed == 17);
    REQUIRE(options.numThreads == "4:1");
    REQUIRE(options.internalHyperpar);
    REQUIRE(options.format == "matrix");
    REQUIRE(options.include == std::vector<std::string>{"intercept", "x", "u"});
    REQUIRE(options.exclude == std::vector<std::string>{"u"});
    REQUIRE(options.verbose == true);
}

TEST_CASE("Quantile properties are accepted", "[config]") {
    fs::path configPath = writeConfig("lateval_test_quant.conf", "property = 0.975quant\n");
    lateval::EvaluationOptions options;
    bool loaded = lateval::loadEvaluationOptionsFromFile(configPath.string(), options);
    fs::remove(configPath);
    REQUIRE(loaded);
    REQUIRE(options.property == "0.975quant");
}

TEST_CASE("Output format names match the predictor", "[config]") {
    for (const std::string name : {"auto", "matrix", "list"}) {
        fs::path configPath = writeConfig("lateval_test_format.conf", "format = " + name + "\n");
        lateval::EvaluationOptions options;
        bool loaded = lateval::loadEvaluationOptionsFromFile(configPath.string(), options);
        fs::remove(configPath);
        REQUIRE(loaded);
        REQUIRE(lateval::outputFormatToString(lateval::parseOutputFormat(options.format)) == name);
    }

    fs::path configPath = writeConfig("lateval_test_format.conf", "format = Matrix\n");
    lateval::EvaluationOptions options;
    try {
        lateval::loadEvaluationOptionsFromFile(configPath.string(), options);
        fs::remove(configPath);
        FAIL("Expected a ConfigurationError");
    } catch (const lateval::ConfigurationError& e) {
        fs::remove(configPath);
        REQUIRE(lateval::categorizeError(e.what()) == lateval::ErrorCategory::Configuration);
        REQUIRE(std::string(e.what()).find("Unknown output format") != std::string::npos);
    }
}

TEST_CASE("Invalid config entries throw", "[config][errors]") {
    lateval::EvaluationOptions options;

    SECTION("Unknown key") {
        fs::path configPath = writeConfig("lateval_test_unknown.conf", "maxIterations = 10\n");
        REQUIRE_THROWS_AS(lateval::loadEvaluationOptionsFromFile(configPath.string(), options),
                          lateval::ConfigurationError);
        fs::remove(configPath);
    }

    SECTION("Missing '='") {
        fs::path configPath = writeConfig("lateval_test_noeq.conf", "verbose\n");
        REQUIRE_THROWS_AS(lateval::loadEvaluationOptionsFromFile(configPath.string(), options),
                          lateval::ConfigurationError);
        fs::remove(configPath);
    }

    SECTION("Bad values") {
        fs::path configPath = writeConfig("lateval_test_values.conf", "format = table\n");
        REQUIRE_THROWS_AS(lateval::loadEvaluationOptionsFromFile(configPath.string(), options),
                          lateval::ConfigurationError);
        fs::remove(configPath);

        configPath = writeConfig("lateval_test_values.conf", "samples = -3\n");
        REQUIRE_THROWS_AS(lateval::loadEvaluationOptionsFromFile(configPath.string(), options),
                          lateval::ConfigurationError);
        fs::remove(configPath);

        configPath = writeConfig("lateval_test_values.conf", "property = median\n");
        REQUIRE_THROWS_AS(lateval::loadEvaluationOptionsFromFile(configPath.string(), options),
                          lateval::ConfigurationError);
        fs::remove(configPath);

        configPath = writeConfig("lateval_test_values.conf", "verbose = maybe\n");
        REQUIRE_THROWS_AS(lateval::loadEvaluationOptionsFromFile(configPath.string(), options),
                          lateval::ConfigurationError);
        fs::remove(configPath);
    }
}
