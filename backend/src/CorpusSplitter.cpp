#include "CorpusSplitter.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>

CorpusSplitter::CorpusSplitter(double test_fraction, std::uint64_t seed)
    : test_fraction_(test_fraction), seed_(seed) {}

// Uniform integer in [0, bound) without modulo bias
static std::uint64_t bounded_draw(std::mt19937_64& rng, std::uint64_t bound) {
    const std::uint64_t limit = std::numeric_limits<std::uint64_t>::max() -
                                (std::numeric_limits<std::uint64_t>::max() % bound);
    std::uint64_t value;
    do {
        value = rng();
    } while (value >= limit);
    return value % bound;
}

size_t CorpusSplitter::test_size(size_t document_count) const {
    // Tolerance keeps e.g. 0.1 * 30 from rounding up to 4
    double raw = test_fraction_ * static_cast<double>(document_count);
    if (!(raw > 0.0)) return 0;
    size_t n_test = static_cast<size_t>(std::ceil(raw - 1e-9));
    return std::max<size_t>(n_test, 1);
}

CorpusSplit CorpusSplitter::split(const std::vector<std::string>& documents) const {
    // Canonical order so the result depends only on the set, seed and ratio
    std::vector<std::string> pool = documents;
    std::sort(pool.begin(), pool.end());
    pool.erase(std::unique(pool.begin(), pool.end()), pool.end());
    const size_t n = pool.size();

    if (!(test_fraction_ > 0.0) || !(test_fraction_ < 1.0)) {
        throw InvalidSplitError(test_fraction_, n, "test fraction must be in (0, 1)");
    }
    if (n < 2) {
        throw InvalidSplitError(test_fraction_, n, "at least 2 documents are required");
    }
    const size_t n_test = test_size(n);
    if (n_test >= n) {
        throw InvalidSplitError(test_fraction_, n, "train partition would be empty");
    }

    // Partial Fisher-Yates: the first n_test slots become the test sample
    std::mt19937_64 rng(seed_);
    for (size_t i = 0; i < n_test; ++i) {
        size_t j = i + static_cast<size_t>(bounded_draw(rng, n - i));
        std::swap(pool[i], pool[j]);
    }

    CorpusSplit result;
    result.test.assign(pool.begin(), pool.begin() + n_test);
    result.train.assign(pool.begin() + n_test, pool.end());
    std::sort(result.test.begin(), result.test.end());
    std::sort(result.train.begin(), result.train.end());

    std::cout << "[CorpusSplitter] " << n << " documents -> " << result.train.size()
              << " train / " << result.test.size() << " test (seed=" << seed_ << ")" << std::endl;
    return result;
}
