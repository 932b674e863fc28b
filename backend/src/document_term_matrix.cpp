#include "document_term_matrix.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <map>
#include <set>
#include <unordered_map>
#include <unordered_set>

long long DocumentTermMatrix::total_count() const {
    long long total = 0;
    for (const auto& e : entries) total += e.count;
    return total;
}

int DocumentTermMatrix::count(const std::string& document_id, const std::string& term) const {
    auto row_it = std::lower_bound(documents.begin(), documents.end(), document_id);
    auto col_it = std::lower_bound(terms.begin(), terms.end(), term);
    if (row_it == documents.end() || *row_it != document_id) return 0;
    if (col_it == terms.end() || *col_it != term) return 0;

    MatrixEntry key{static_cast<int>(row_it - documents.begin()), static_cast<int>(col_it - terms.begin()), 0};
    auto it = std::lower_bound(entries.begin(), entries.end(), key, [](const MatrixEntry& a, const MatrixEntry& b) {
        return a.row != b.row ? a.row < b.row : a.col < b.col;
    });
    if (it == entries.end() || it->row != key.row || it->col != key.col) return 0;
    return it->count;
}

json DocumentTermMatrix::to_json() const {
    json cells = json::array();
    for (const auto& e : entries) cells.push_back({e.row, e.col, e.count});
    return {
        {"documents", documents},
        {"terms", terms},
        {"entries", cells}
    };
}

DocumentTermMatrixBuilder::DocumentTermMatrixBuilder() {}

DocumentTermMatrix DocumentTermMatrixBuilder::build(const FrequencyTable& table) const {
    return build(table, table.documents());
}

DocumentTermMatrix DocumentTermMatrixBuilder::build(const FrequencyTable& table,
                                                    const std::vector<std::string>& subset) const {
    std::unordered_set<std::string> wanted(subset.begin(), subset.end());

    // Pass 1: rows and columns present in the subset (both come out sorted)
    DocumentTermMatrix matrix;
    std::set<std::string> term_set;
    for (const auto& [doc_id, lemmas] : table.term_counts) {
        if (!wanted.count(doc_id) || lemmas.empty()) continue;
        matrix.documents.push_back(doc_id);
        for (const auto& [lemma, count] : lemmas) term_set.insert(lemma);
    }
    matrix.terms.assign(term_set.begin(), term_set.end());

    std::unordered_map<std::string, int> term_index;
    term_index.reserve(matrix.terms.size());
    for (size_t i = 0; i < matrix.terms.size(); ++i) term_index[matrix.terms[i]] = static_cast<int>(i);

    // Pass 2: cells, row-major. Inner map is sorted so columns ascend.
    for (size_t row = 0; row < matrix.documents.size(); ++row) {
        const auto& lemmas = table.term_counts.at(matrix.documents[row]);
        for (const auto& [lemma, count] : lemmas) {
            matrix.entries.push_back({static_cast<int>(row), term_index[lemma], count});
        }
    }

    size_t absent = wanted.size() - matrix.documents.size();
    if (absent > 0) {
        std::cout << "[DTMBuilder] " << absent << " requested documents have no terms and are absent" << std::endl;
    }
    std::cout << "[DTMBuilder] Built " << matrix.num_rows() << " x " << matrix.num_cols()
              << " matrix, " << matrix.nnz() << " non-zero cells" << std::endl;
    return matrix;
}

std::string AlignmentReport::summary() const {
    return std::to_string(dropped_terms.size()) + " terms dropped, " +
           std::to_string(zero_filled_terms.size()) + " terms zero-filled, " +
           std::to_string(dropped_documents.size()) + " documents left empty";
}

DocumentTermMatrix align_to_vocabulary(const DocumentTermMatrix& matrix,
                                       const std::vector<std::string>& vocabulary,
                                       AlignmentReport& report) {
    report = AlignmentReport{};

    std::vector<std::string> vocab = vocabulary;
    std::sort(vocab.begin(), vocab.end());
    vocab.erase(std::unique(vocab.begin(), vocab.end()), vocab.end());

    std::unordered_map<std::string, int> vocab_index;
    vocab_index.reserve(vocab.size());
    for (size_t i = 0; i < vocab.size(); ++i) vocab_index[vocab[i]] = static_cast<int>(i);

    // Old column -> new column, -1 when the term is outside the vocabulary
    std::vector<int> col_map(matrix.terms.size(), -1);
    for (size_t c = 0; c < matrix.terms.size(); ++c) {
        auto it = vocab_index.find(matrix.terms[c]);
        if (it == vocab_index.end()) {
            report.dropped_terms.push_back(matrix.terms[c]);
        } else {
            col_map[c] = it->second;
        }
    }
    std::set_difference(vocab.begin(), vocab.end(), matrix.terms.begin(), matrix.terms.end(),
                        std::back_inserter(report.zero_filled_terms));

    // Regroup surviving cells per row, keeping rows that still have counts
    std::map<int, std::vector<MatrixEntry>> cells_by_row;
    for (const auto& e : matrix.entries) {
        int new_col = col_map[e.col];
        if (new_col < 0) continue;
        cells_by_row[e.row].push_back({e.row, new_col, e.count});
    }

    DocumentTermMatrix aligned;
    aligned.terms = vocab;
    for (size_t row = 0; row < matrix.documents.size(); ++row) {
        auto it = cells_by_row.find(static_cast<int>(row));
        if (it == cells_by_row.end()) {
            report.dropped_documents.push_back(matrix.documents[row]);
            continue;
        }
        int new_row = static_cast<int>(aligned.documents.size());
        aligned.documents.push_back(matrix.documents[row]);

        auto& cells = it->second;
        std::sort(cells.begin(), cells.end(), [](const MatrixEntry& a, const MatrixEntry& b) { return a.col < b.col; });
        for (auto& cell : cells) {
            cell.row = new_row;
            aligned.entries.push_back(cell);
        }
    }

    if (report.mismatch()) {
        std::cerr << "[DTMBuilder] VocabularyMismatchWarning: test matrix columns differ from training vocabulary ("
                  << report.summary() << ")" << std::endl;
    }
    return aligned;
}
