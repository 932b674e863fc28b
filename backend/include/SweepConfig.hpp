#pragma once
// SweepConfig.hpp
// Settings for the TF-IDF and topic sweep tools, loaded from a JSON file.
// Every key is optional and falls back to the default below.

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct SweepConfig {
    // Split
    double test_fraction = 0.2;
    unsigned long long seed = 42;

    // Sweep
    std::vector<int> k_values{2, 3, 4, 5, 6, 7, 8, 9, 10};
    size_t workers = 0;
    int fit_timeout_seconds = 0;
    std::string fit_command;
    std::string work_dir = "data/temp_models";

    // Filters
    std::string stopwords_path;
    std::vector<std::string> punctuation_tags{"PUNCT"};
    size_t matrix_min_length = 3;
    size_t frequency_min_length = 3;

    // Reports
    std::string output_dir = "data/processed";
    size_t top_n_terms = 10;

    // Throws ConfigError when the file is unreadable or a value is invalid
    static SweepConfig load(const std::string& config_path);
    static SweepConfig from_json(const json& j);

    // Settings that change the computed curve (used as the cache key)
    json curve_settings() const;

    void validate() const;
};
