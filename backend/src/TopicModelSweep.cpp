#include "TopicModelSweep.hpp"
#include "errors.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <stdexcept>
#include <thread>

TopicModelSweep::TopicModelSweep(ModelFitter& fitter, SweepOptions options)
    : fitter_(fitter), options_(std::move(options)) {
    validate_k_values(options_.k_values);
}

void TopicModelSweep::validate_k_values(const std::vector<int>& k_values) {
    if (k_values.empty()) {
        throw std::invalid_argument("K list is empty");
    }
    for (size_t i = 0; i < k_values.size(); ++i) {
        if (k_values[i] < 1) {
            throw std::invalid_argument("K must be >= 1, got " + std::to_string(k_values[i]));
        }
        if (i > 0 && k_values[i] <= k_values[i - 1]) {
            throw std::invalid_argument("K list must be strictly ascending at position " + std::to_string(i));
        }
    }
}

size_t TopicModelSweep::worker_count() const {
    size_t workers = options_.workers;
    if (workers == 0) workers = std::thread::hardware_concurrency();
    if (workers == 0) workers = 4;
    return std::min(workers, options_.k_values.size());
}

PerplexityCurve TopicModelSweep::run(const DocumentTermMatrix& train, const DocumentTermMatrix& test) const {
    PerplexityCurve curve;

    // The model only knows the training columns
    DocumentTermMatrix aligned_test = align_to_vocabulary(test, train.terms, curve.alignment);
    if (aligned_test.num_rows() == 0) {
        throw SweepFailedError("Test matrix has no documents left after alignment to the training vocabulary");
    }

    std::cout << "[TopicSweep] Fitting K in [" << options_.k_values.front() << ".."
              << options_.k_values.back() << "] (" << options_.k_values.size() << " values) with "
              << fitter_.name() << std::endl;

    std::vector<SweepPoint> results;
    {
        SweepWorkerPool pool(worker_count(), fitter_, train, aligned_test);

        std::vector<std::future<SweepPoint>> futures;
        futures.reserve(options_.k_values.size());
        for (int k : options_.k_values) {
            futures.push_back(pool.submit_k(k));
        }
        for (auto& f : futures) {
            results.push_back(f.get());
        }
    }

    // Ordered merge, independent of completion order
    std::sort(results.begin(), results.end(), [](const SweepPoint& a, const SweepPoint& b) { return a.k < b.k; });
    for (auto& point : results) {
        if (point.success) {
            curve.points.push_back({point.k, point.perplexity});
        } else {
            curve.failures.push_back(std::move(point));
        }
    }

    if (curve.points.empty()) {
        throw SweepFailedError("Every K failed (" + std::to_string(curve.failures.size()) + " values), first error: " +
                               (curve.failures.empty() ? std::string("none") : curve.failures.front().error));
    }
    if (!curve.failures.empty()) {
        std::cerr << "[TopicSweep] Warning: " << curve.failures.size() << " of " << results.size()
                  << " K values failed and are missing from the curve" << std::endl;
    }
    return curve;
}

int ModelSelector::select_k(const PerplexityCurve& curve) {
    return select_k(curve.points);
}

int ModelSelector::select_k(const std::vector<CurvePoint>& points) {
    if (points.empty()) {
        throw SweepFailedError("Cannot select K from an empty perplexity curve");
    }
    return ranked(points).front().k;
}

std::vector<CurvePoint> ModelSelector::ranked(const std::vector<CurvePoint>& points) {
    std::vector<CurvePoint> out = points;
    std::sort(out.begin(), out.end(), [](const CurvePoint& a, const CurvePoint& b) {
        if (a.perplexity != b.perplexity) return a.perplexity < b.perplexity;
        return a.k < b.k;
    });
    return out;
}
