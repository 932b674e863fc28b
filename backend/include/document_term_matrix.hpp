#ifndef DOCUMENT_TERM_MATRIX_HPP
#define DOCUMENT_TERM_MATRIX_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "FrequencyAggregator.hpp"

using json = nlohmann::json;

// Single non-zero cell
struct MatrixEntry {
    int row;
    int col;
    int count;
};

// Sparse document-term matrix.
// Rows are document ids in ascending order, columns are terms in ascending
// order, entries are sorted by (row, col).
struct DocumentTermMatrix {
    std::vector<std::string> documents;
    std::vector<std::string> terms;
    std::vector<MatrixEntry> entries;

    size_t num_rows() const { return documents.size(); }
    size_t num_cols() const { return terms.size(); }
    size_t nnz() const { return entries.size(); }
    long long total_count() const;

    // 0 when the cell is empty or out of range
    int count(const std::string& document_id, const std::string& term) const;

    // {"documents": [...], "terms": [...], "entries": [[row, col, count], ...]}
    json to_json() const;
};

// Builds one matrix per document subset. The column set is exactly the terms
// seen in that subset; no alignment to any other vocabulary happens here.
class DocumentTermMatrixBuilder {
public:
    DocumentTermMatrixBuilder();

    DocumentTermMatrix build(const FrequencyTable& table) const;
    DocumentTermMatrix build(const FrequencyTable& table, const std::vector<std::string>& subset) const;
};

// Outcome of re-aligning a matrix to a reference vocabulary
struct AlignmentReport {
    std::vector<std::string> dropped_terms;       // In the matrix, not in the vocabulary
    std::vector<std::string> zero_filled_terms;   // In the vocabulary, not in the matrix
    std::vector<std::string> dropped_documents;   // Rows left with no counts

    bool mismatch() const { return !dropped_terms.empty() || !zero_filled_terms.empty(); }
    std::string summary() const;
};

// Returns a new matrix whose columns equal `vocabulary` (sorted, distinct).
// A mismatch is logged as VocabularyMismatchWarning and returned in `report`.
DocumentTermMatrix align_to_vocabulary(const DocumentTermMatrix& matrix,
                                       const std::vector<std::string>& vocabulary,
                                       AlignmentReport& report);

#endif // DOCUMENT_TERM_MATRIX_HPP
