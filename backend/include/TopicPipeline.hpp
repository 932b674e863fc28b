#pragma once
// TopicPipeline.hpp
// Wires the stages together:
//   tokens -> VocabularyFilter -> FrequencyAggregator -> {TfIdfEngine, DTM builder}
//   documents -> CorpusSplitter -> train/test DTMs -> TopicModelSweep -> ModelSelector
// Every stage returns fresh values; nothing is updated in place.

#include <cstdint>
#include <string>
#include <vector>
#include "SweepConfig.hpp"
#include "token_stream.hpp"
#include "VocabularyFilter.hpp"
#include "FrequencyAggregator.hpp"
#include "TfIdfEngine.hpp"
#include "document_term_matrix.hpp"
#include "CorpusSplitter.hpp"
#include "TopicModelSweep.hpp"

// Everything derived from one token stream and one configuration
struct PreparedCorpus {
    FrequencyTable frequency_table;      // frequency preset, feeds TF-IDF
    std::vector<TfIdfRecord> tfidf;
    FrequencyTable matrix_table;         // matrix preset, feeds the DTMs
    std::vector<std::string> vocabulary; // controlled vocabulary of the matrix preset
    CorpusSplit split;
    DocumentTermMatrix train;
    DocumentTermMatrix test;
};

class TopicPipeline {
public:
    explicit TopicPipeline(SweepConfig config);

    VocabularyFilter make_matrix_filter() const;
    VocabularyFilter make_frequency_filter() const;

    // Filtering, counting, TF-IDF, split and both matrices
    PreparedCorpus prepare(const std::vector<Token>& tokens) const;

    PerplexityCurve sweep(const PreparedCorpus& corpus, ModelFitter& fitter) const;

    // Cache key for the curve: token content hash plus curve settings
    std::string cache_key(std::uint64_t token_hash) const;

    const SweepConfig& config() const { return config_; }

private:
    SweepConfig config_;
};
