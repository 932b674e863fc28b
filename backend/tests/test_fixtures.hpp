#pragma once
// Shared helpers for the unit tests: token builders and an in-process fitter.

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "ModelFitter.hpp"
#include "token_stream.hpp"

inline Token make_token(const std::string& doc, const std::string& lemma, const std::string& pos = "NOUN") {
    return Token{doc, lemma, lemma, pos};
}

// Tokens from "doc -> space separated lemmas"
inline std::vector<Token> make_tokens(const std::vector<std::pair<std::string, std::string>>& docs) {
    std::vector<Token> tokens;
    for (const auto& [doc, text] : docs) {
        size_t start = 0;
        while (start < text.size()) {
            size_t end = text.find(' ', start);
            if (end == std::string::npos) end = text.size();
            if (end > start) tokens.push_back(make_token(doc, text.substr(start, end - start)));
            start = end + 1;
        }
    }
    return tokens;
}

class FakeModel : public TopicModel {
public:
    FakeModel(int k, long long train_total) : k_(k), train_total_(train_total) {}
    int k() const override { return k_; }
    long long train_total() const { return train_total_; }

private:
    int k_;
    long long train_total_;
};

// Deterministic fitter. Perplexity defaults to a function of K and the
// matrices; specific K values can be scripted to fail or to be slow.
class FakeFitter : public ModelFitter {
public:
    std::map<int, double> scores;            // Fixed score per K
    std::set<int> failing_k;                 // fit() throws for these
    std::map<int, int> delay_ms;             // Sleep inside fit()
    std::map<int, double> raw_scores;        // Returned as-is, even if invalid

    std::unique_ptr<TopicModel> fit(const DocumentTermMatrix& train, int k) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fit_calls_.push_back(k);
            train_terms_seen_ = train.terms;
        }
        auto delay = delay_ms.find(k);
        if (delay != delay_ms.end()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay->second));
        }
        if (failing_k.count(k)) {
            throw std::runtime_error("model diverged");
        }
        return std::make_unique<FakeModel>(k, train.total_count());
    }

    double perplexity(const TopicModel& model, const DocumentTermMatrix& test) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            test_terms_seen_ = test.terms;
        }
        auto raw = raw_scores.find(model.k());
        if (raw != raw_scores.end()) return raw->second;
        auto it = scores.find(model.k());
        if (it != scores.end()) return it->second;

        const auto& fake = dynamic_cast<const FakeModel&>(model);
        return 100.0 + 10.0 * model.k() + static_cast<double>(fake.train_total()) +
               static_cast<double>(test.total_count()) / static_cast<double>(model.k());
    }

    std::string name() const override { return "fake"; }

    std::vector<int> fit_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fit_calls_;
    }
    std::vector<std::string> train_terms_seen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return train_terms_seen_;
    }
    std::vector<std::string> test_terms_seen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return test_terms_seen_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<int> fit_calls_;
    std::vector<std::string> train_terms_seen_;
    std::vector<std::string> test_terms_seen_;
};
