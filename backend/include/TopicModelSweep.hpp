#pragma once
// TopicModelSweep.hpp
// Fits one topic model per candidate K on the training matrix and scores it
// by held-out perplexity on the test matrix, after re-aligning the test
// matrix to the training vocabulary. ModelSelector picks K from the curve.

#include <string>
#include <vector>
#include "ModelFitter.hpp"
#include "SweepWorkerPool.hpp"
#include "document_term_matrix.hpp"

struct CurvePoint {
    int k;
    double perplexity;
};

// Scored points in ascending K; failed K values are listed separately
struct PerplexityCurve {
    std::vector<CurvePoint> points;
    std::vector<SweepPoint> failures;
    AlignmentReport alignment;

    bool empty() const { return points.empty(); }
};

struct SweepOptions {
    std::vector<int> k_values{2, 3, 4, 5, 6, 7, 8, 9, 10};
    size_t workers = 0;   // 0 = hardware concurrency, capped at the number of K values
};

class TopicModelSweep {
public:
    TopicModelSweep(ModelFitter& fitter, SweepOptions options);

    // Throws SweepFailedError if every K fails or the aligned test matrix is empty
    PerplexityCurve run(const DocumentTermMatrix& train, const DocumentTermMatrix& test) const;

    // Ascending, no duplicates, every K >= 1. Throws std::invalid_argument.
    static void validate_k_values(const std::vector<int>& k_values);

private:
    ModelFitter& fitter_;
    SweepOptions options_;

    size_t worker_count() const;
};

class ModelSelector {
public:
    // K with the lowest perplexity, ties to the smallest K.
    // Throws SweepFailedError on an empty curve.
    static int select_k(const PerplexityCurve& curve);
    static int select_k(const std::vector<CurvePoint>& points);

    // Points by ascending perplexity, ties by K
    static std::vector<CurvePoint> ranked(const std::vector<CurvePoint>& points);
};
