#pragma once
// CorpusSplitter.hpp
// Partitions a document set into Train/Test by a test fraction and a seed.
// ceil(f * N) documents are drawn uniformly without replacement for Test.
//
// Sampling uses std::mt19937_64 (its output sequence is fixed by the
// standard) with an explicit rejection-sampled bounded draw, so the same
// seed gives the same split on every platform and standard library.

#include <string>
#include <vector>
#include <cstdint>

struct CorpusSplit {
    std::vector<std::string> train;   // Sorted
    std::vector<std::string> test;    // Sorted
};

class CorpusSplitter {
public:
    CorpusSplitter(double test_fraction = 0.2, std::uint64_t seed = 42);

    // Throws InvalidSplitError on a bad fraction, fewer than 2 documents,
    // or a fraction so large that Train would be empty
    CorpusSplit split(const std::vector<std::string>& documents) const;

    // Number of Test documents for N documents
    size_t test_size(size_t document_count) const;

    double test_fraction() const { return test_fraction_; }
    std::uint64_t seed() const { return seed_; }

private:
    double test_fraction_;
    std::uint64_t seed_;
};
