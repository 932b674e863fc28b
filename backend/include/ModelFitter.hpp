#pragma once
// ModelFitter.hpp
// Capability interface to the external topic-model library.
// The sweep only ever calls fit() and perplexity(); the numerical fitting
// itself lives outside this project.
//
// Implementations are called concurrently from the sweep pool, one call per
// K, and must not share mutable state between calls.

#include <memory>
#include <string>
#include "document_term_matrix.hpp"

// Opaque fitted model
class TopicModel {
public:
    virtual ~TopicModel() = default;
    virtual int k() const = 0;
};

class ModelFitter {
public:
    virtual ~ModelFitter() = default;

    // Fit a K-topic model on `train`. Throws on failure.
    virtual std::unique_ptr<TopicModel> fit(const DocumentTermMatrix& train, int k) = 0;

    // Held-out perplexity of `model` on `test`, whose columns already match
    // the training vocabulary. Lower is better.
    virtual double perplexity(const TopicModel& model, const DocumentTermMatrix& test) = 0;

    virtual std::string name() const = 0;
};
