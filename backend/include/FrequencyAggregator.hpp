#pragma once
// FrequencyAggregator.hpp
// Counts surviving tokens per document (word_ct) and per (document, lemma) (term_ct).
// Documents that end up with zero surviving tokens produce no rows and are
// reported in FrequencyTable::empty_documents.

#include <string>
#include <vector>
#include <map>
#include <utility>
#include "token_stream.hpp"

struct TermCount {
    std::string document_id;
    std::string lemma;
    int count;
};

// Aggregated counts. Maps are ordered so every derived artifact is stable.
struct FrequencyTable {
    std::map<std::string, std::map<std::string, int>> term_counts;  // doc -> lemma -> term_ct
    std::map<std::string, int> word_counts;                         // doc -> word_ct
    std::vector<std::string> empty_documents;

    // Flat TermCount rows ordered by (document_id, lemma)
    std::vector<TermCount> rows() const;

    std::vector<std::string> documents() const;
    int word_count(const std::string& document_id) const;
    size_t row_count() const;

    // Corpus-wide total per lemma, descending count then lemma
    std::vector<std::pair<std::string, long long>> term_frequencies() const;
};

class FrequencyAggregator {
public:
    FrequencyAggregator();

    // `tokens` must already be filtered. `corpus_documents` lists every
    // document of the corpus so that fully filtered documents can be reported.
    FrequencyTable aggregate(const std::vector<Token>& tokens,
                             const std::vector<std::string>& corpus_documents = {}) const;

    // Writes [{"lemma": ..., "count": ...}] for the coarse frequency view
    bool save_term_frequencies(const FrequencyTable& table, const std::string& output_path, size_t limit = 0) const;
};
