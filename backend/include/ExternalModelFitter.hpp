#pragma once
// ExternalModelFitter.hpp
// ModelFitter that delegates to an external modelling program (for example a
// Python or R script wrapping an LDA library). Matrices and results are
// exchanged through JSON files in a work directory:
//
//   <command> fit <train_matrix.json> <k> <seed> <model_out>
//   <command> perplexity <model> <test_matrix.json> <result_out.json>
//
// The result file must contain {"perplexity": <number>}. Any non-zero exit
// status is a failure. With a timeout set, each call runs under coreutils
// `timeout` and exit status 124 is reported as a timeout.
//
// scripts/fit_lda.py implements this protocol with scikit-learn's
// LatentDirichletAllocation (batch learning, n_jobs=1, random_state=seed).
// With the same matrix, K, seed and scikit-learn/NumPy versions it produces
// the same model and perplexity on every run.

#include <atomic>
#include <utility>
#include <string>
#include "ModelFitter.hpp"

// Removes the file when it goes out of scope
class ScopedTempFile {
public:
    explicit ScopedTempFile(std::string path);
    ~ScopedTempFile();

    ScopedTempFile(ScopedTempFile&& other) noexcept;
    ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;
    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Model produced by the external program; owns its model file
class ExternalTopicModel : public TopicModel {
public:
    ExternalTopicModel(int k, ScopedTempFile model_file)
        : k_(k), model_file_(std::move(model_file)) {}

    int k() const override { return k_; }
    const std::string& model_path() const { return model_file_.path(); }

private:
    int k_;
    ScopedTempFile model_file_;
};

struct ExternalFitterOptions {
    std::string command;               // Program (and fixed leading args) to invoke
    std::string work_dir = "data/temp_models";
    int timeout_seconds = 0;           // 0 disables the timeout
    unsigned long long seed = 42;      // Passed through to the external fit
};

class ExternalModelFitter : public ModelFitter {
public:
    explicit ExternalModelFitter(ExternalFitterOptions options);

    std::unique_ptr<TopicModel> fit(const DocumentTermMatrix& train, int k) override;
    double perplexity(const TopicModel& model, const DocumentTermMatrix& test) override;
    std::string name() const override { return "external:" + options_.command; }

    // Full shell command line for one invocation (exposed for tests)
    std::string command_line(const std::string& args) const;

private:
    ExternalFitterOptions options_;
    std::atomic<unsigned long> call_counter_{0};

    std::string temp_path(int k, const std::string& suffix);
    void write_matrix(const DocumentTermMatrix& matrix, const std::string& path, int k) const;
    void run(const std::string& args, int k, const std::string& stage) const;
};
