#pragma once
// TfIdfEngine.hpp
// Term importance scores from aggregated counts:
//   tf(t,d)    = term_ct(t,d) / word_ct(d)
//   idf(t)     = ln(N / n_t), N and n_t counted over the same document set
//   tfidf(t,d) = tf * idf

#include <string>
#include <vector>
#include <map>
#include "FrequencyAggregator.hpp"

struct TfIdfRecord {
    std::string document_id;
    std::string lemma;
    double tf;
    double idf;
    double tfidf;
};

class TfIdfEngine {
public:
    TfIdfEngine();

    // Throws EmptyDocumentError for a document with rows but word_ct == 0
    std::vector<TfIdfRecord> compute(const FrequencyTable& table) const;

    // lemma -> idf over the documents of `table`
    std::map<std::string, double> inverse_document_frequency(const FrequencyTable& table) const;

    // Highest tfidf lemmas per document (ties broken by lemma)
    std::map<std::string, std::vector<TfIdfRecord>> top_terms(const std::vector<TfIdfRecord>& records,
                                                               size_t n) const;

    // Artifacts
    bool save_table(const std::vector<TfIdfRecord>& records, const std::string& output_path) const;
    bool save_top_terms(const std::map<std::string, std::vector<TfIdfRecord>>& top,
                        const std::string& output_path) const;
};
