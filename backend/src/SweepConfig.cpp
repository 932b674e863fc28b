#include "SweepConfig.hpp"
#include "errors.hpp"
#include "TopicModelSweep.hpp"
#include <fstream>
#include <iostream>

SweepConfig SweepConfig::load(const std::string& config_path) {
    std::ifstream in(config_path);
    if (!in.is_open()) {
        throw ConfigError("Could not open config file: " + config_path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("Error parsing config " + config_path + ": " + e.what());
    }

    SweepConfig config = from_json(j);
    std::cout << "[Config] Loaded " << config_path << std::endl;
    return config;
}

// Unsigned keys would otherwise wrap a negative value
static void require_non_negative(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number() && j[key].get<double>() < 0) {
        throw ConfigError(std::string(key) + " must be a non-negative integer");
    }
}

SweepConfig SweepConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }
    require_non_negative(j, "seed");
    require_non_negative(j, "workers");
    require_non_negative(j, "matrix_min_length");
    require_non_negative(j, "frequency_min_length");
    require_non_negative(j, "top_n_terms");

    SweepConfig config;
    try {
        config.test_fraction = j.value("test_fraction", config.test_fraction);
        config.seed = j.value("seed", config.seed);
        config.k_values = j.value("k_values", config.k_values);
        config.workers = j.value("workers", config.workers);
        config.fit_timeout_seconds = j.value("fit_timeout_seconds", config.fit_timeout_seconds);
        config.fit_command = j.value("fit_command", config.fit_command);
        config.work_dir = j.value("work_dir", config.work_dir);
        config.stopwords_path = j.value("stopwords_path", config.stopwords_path);
        config.punctuation_tags = j.value("punctuation_tags", config.punctuation_tags);
        config.matrix_min_length = j.value("matrix_min_length", config.matrix_min_length);
        config.frequency_min_length = j.value("frequency_min_length", config.frequency_min_length);
        config.output_dir = j.value("output_dir", config.output_dir);
        config.top_n_terms = j.value("top_n_terms", config.top_n_terms);
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("Config value has the wrong type: ") + e.what());
    }

    config.validate();
    return config;
}

void SweepConfig::validate() const {
    if (!(test_fraction > 0.0 && test_fraction < 1.0)) {
        throw ConfigError("test_fraction must be in (0, 1)");
    }
    if (fit_timeout_seconds < 0) {
        throw ConfigError("fit_timeout_seconds must be >= 0");
    }
    try {
        TopicModelSweep::validate_k_values(k_values);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("k_values: ") + e.what());
    }
}

json SweepConfig::curve_settings() const {
    return {
        {"test_fraction", test_fraction},
        {"seed", seed},
        {"k_values", k_values},
        {"fit_command", fit_command},
        {"fit_timeout_seconds", fit_timeout_seconds},
        {"stopwords_path", stopwords_path},
        {"punctuation_tags", punctuation_tags},
        {"matrix_min_length", matrix_min_length}
    };
}
