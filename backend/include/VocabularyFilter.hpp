#pragma once
// VocabularyFilter.hpp
// Decides which lemmas survive into the controlled vocabulary.
// Filters stopwords (case-insensitive), punctuation-tagged tokens,
// numeric-like lemmas and short lemmas.
//
// Two presets exist and are configured independently:
//   matrix    - strips non-alphabetic characters before the length check,
//               the stripped form becomes the term (used for the DTM)
//   frequency - keeps the lemma as written, drops anything with a digit
//               or '%' (used for TF-IDF and raw frequency views)

#include <string>
#include <vector>
#include <unordered_set>
#include "token_stream.hpp"

struct FilterOptions {
    std::string name;
    bool strip_non_alpha = false;   // Remove non [a-z] chars before length check
    bool drop_numeric = false;      // Drop lemmas containing a digit or '%'
    bool drop_stopwords = true;
    size_t min_length = 3;
    std::unordered_set<std::string> punctuation_tags{"PUNCT"};
};

class VocabularyFilter {
public:
    explicit VocabularyFilter(FilterOptions options);

    static FilterOptions matrix_preset();
    static FilterOptions frequency_preset();

    // Stopword configuration
    void set_stopwords(const std::vector<std::string>& words);
    void load_stopwords_from_file(const std::string& path);

    // Returns the normalized term, or an empty string if the token is dropped
    std::string normalize(const Token& token) const;
    bool accepts(const Token& token) const { return !normalize(token).empty(); }

    // Surviving tokens with their lemma replaced by the normalized term
    std::vector<Token> apply(const std::vector<Token>& tokens) const;

    // Sorted distinct surviving terms
    std::vector<std::string> vocabulary(const std::vector<Token>& tokens) const;

    const FilterOptions& options() const { return options_; }
    bool is_stopword(const std::string& word) const;
    size_t stopword_count() const { return stop_words_.size(); }

private:
    FilterOptions options_;
    std::unordered_set<std::string> stop_words_;

    void load_default_stopwords();
};
