#include "ExternalModelFitter.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sys/wait.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

ScopedTempFile::ScopedTempFile(std::string path) : path_(std::move(path)) {}

ScopedTempFile::~ScopedTempFile() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove(path_, ec);
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
    if (this != &other) {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ExternalModelFitter::ExternalModelFitter(ExternalFitterOptions options) : options_(std::move(options)) {
    if (options_.command.empty()) {
        throw ConfigError("External fitter needs a command");
    }
    if (!fs::exists(options_.work_dir)) {
        fs::create_directories(options_.work_dir);
    }
    std::cout << "[ExternalFitter] Using command: " << options_.command;
    if (options_.timeout_seconds > 0) std::cout << " (timeout " << options_.timeout_seconds << "s)";
    std::cout << "\n";
}

std::string ExternalModelFitter::command_line(const std::string& args) const {
    std::string cmd;
    if (options_.timeout_seconds > 0) {
        cmd = "timeout " + std::to_string(options_.timeout_seconds) + " ";
    }
    return cmd + options_.command + " " + args;
}

// Unique per process, K and call so concurrent fits never collide
std::string ExternalModelFitter::temp_path(int k, const std::string& suffix) {
    unsigned long n = call_counter_++;
    return (fs::path(options_.work_dir) /
            ("k" + std::to_string(k) + "_" + std::to_string(::getpid()) + "_" + std::to_string(n) + suffix))
        .string();
}

void ExternalModelFitter::write_matrix(const DocumentTermMatrix& matrix, const std::string& path, int k) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw ExternalFitFailure(k, "could not write matrix file " + path);
    }
    out << matrix.to_json().dump();
    if (!out.good()) {
        throw ExternalFitFailure(k, "write failed for " + path);
    }
}

void ExternalModelFitter::run(const std::string& args, int k, const std::string& stage) const {
    std::string cmd = command_line(args);
    int ret = std::system(cmd.c_str());

    if (ret == -1) {
        throw ExternalFitFailure(k, stage + ": could not start process");
    }
    if (WIFEXITED(ret)) {
        int status = WEXITSTATUS(ret);
        if (status == 0) return;
        if (options_.timeout_seconds > 0 && status == 124) {
            throw ExternalFitFailure(k, stage + ": timed out after " + std::to_string(options_.timeout_seconds) + "s");
        }
        throw ExternalFitFailure(k, stage + ": exited with status " + std::to_string(status));
    }
    throw ExternalFitFailure(k, stage + ": terminated abnormally");
}

std::unique_ptr<TopicModel> ExternalModelFitter::fit(const DocumentTermMatrix& train, int k) {
    ScopedTempFile matrix_file(temp_path(k, "_train.json"));
    ScopedTempFile model_file(temp_path(k, "_model"));

    write_matrix(train, matrix_file.path(), k);
    run("fit \"" + matrix_file.path() + "\" " + std::to_string(k) + " " + std::to_string(options_.seed) +
            " \"" + model_file.path() + "\"",
        k, "fit");

    if (!fs::exists(model_file.path())) {
        throw ExternalFitFailure(k, "fit produced no model file");
    }
    return std::make_unique<ExternalTopicModel>(k, std::move(model_file));
}

double ExternalModelFitter::perplexity(const TopicModel& model, const DocumentTermMatrix& test) {
    const auto* external = dynamic_cast<const ExternalTopicModel*>(&model);
    if (!external) {
        throw ExternalFitFailure(model.k(), "model was not produced by this fitter");
    }
    const int k = model.k();

    ScopedTempFile matrix_file(temp_path(k, "_test.json"));
    ScopedTempFile result_file(temp_path(k, "_result.json"));

    write_matrix(test, matrix_file.path(), k);
    run("perplexity \"" + external->model_path() + "\" \"" + matrix_file.path() + "\" \"" + result_file.path() + "\"",
        k, "perplexity");

    std::ifstream in(result_file.path());
    if (!in.is_open()) {
        throw ExternalFitFailure(k, "perplexity produced no result file");
    }

    try {
        json j;
        in >> j;
        if (!j.contains("perplexity") || !j["perplexity"].is_number()) {
            throw ExternalFitFailure(k, "result file has no numeric 'perplexity'");
        }
        return j["perplexity"].get<double>();
    } catch (const json::exception& e) {
        throw ExternalFitFailure(k, std::string("result parse error: ") + e.what());
    }
}
