#include "FrequencyAggregator.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::vector<TermCount> FrequencyTable::rows() const {
    std::vector<TermCount> out;
    out.reserve(row_count());
    for (const auto& [doc_id, lemmas] : term_counts) {
        for (const auto& [lemma, count] : lemmas) {
            out.push_back({doc_id, lemma, count});
        }
    }
    return out;
}

std::vector<std::string> FrequencyTable::documents() const {
    std::vector<std::string> ids;
    ids.reserve(word_counts.size());
    for (const auto& [doc_id, total] : word_counts) ids.push_back(doc_id);
    return ids;
}

int FrequencyTable::word_count(const std::string& document_id) const {
    auto it = word_counts.find(document_id);
    return (it == word_counts.end()) ? 0 : it->second;
}

size_t FrequencyTable::row_count() const {
    size_t n = 0;
    for (const auto& [doc_id, lemmas] : term_counts) n += lemmas.size();
    return n;
}

std::vector<std::pair<std::string, long long>> FrequencyTable::term_frequencies() const {
    std::map<std::string, long long> totals;
    for (const auto& [doc_id, lemmas] : term_counts) {
        for (const auto& [lemma, count] : lemmas) totals[lemma] += count;
    }

    std::vector<std::pair<std::string, long long>> out(totals.begin(), totals.end());
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    return out;
}

FrequencyAggregator::FrequencyAggregator() {}

FrequencyTable FrequencyAggregator::aggregate(const std::vector<Token>& tokens,
                                              const std::vector<std::string>& corpus_documents) const {
    FrequencyTable table;

    for (const auto& token : tokens) {
        table.term_counts[token.document_id][token.lemma]++;
        table.word_counts[token.document_id]++;
    }

    // Documents whose every token was filtered away
    for (const auto& doc_id : corpus_documents) {
        if (!table.word_counts.count(doc_id)) {
            table.empty_documents.push_back(doc_id);
        }
    }
    std::sort(table.empty_documents.begin(), table.empty_documents.end());
    table.empty_documents.erase(std::unique(table.empty_documents.begin(), table.empty_documents.end()),
                                table.empty_documents.end());

    if (!table.empty_documents.empty()) {
        std::cerr << "[FrequencyAggregator] Warning: " << table.empty_documents.size()
                  << " documents have no surviving tokens and are excluded (first: "
                  << table.empty_documents.front() << ")" << std::endl;
    }
    std::cout << "[FrequencyAggregator] " << table.word_counts.size() << " documents, "
              << table.row_count() << " term rows" << std::endl;
    return table;
}

bool FrequencyAggregator::save_term_frequencies(const FrequencyTable& table, const std::string& output_path,
                                                size_t limit) const {
    auto freqs = table.term_frequencies();
    if (limit > 0 && freqs.size() > limit) freqs.resize(limit);

    json j = json::array();
    for (const auto& [lemma, count] : freqs) {
        j.push_back({{"lemma", lemma}, {"count", count}});
    }

    fs::path outp(output_path);
    if (outp.has_parent_path()) fs::create_directories(outp.parent_path());

    std::ofstream out(output_path);
    if (!out.is_open()) {
        std::cerr << "[FrequencyAggregator] Error: could not create file " << output_path << std::endl;
        return false;
    }
    out << j.dump(2) << "\n";
    std::cout << "[FrequencyAggregator] Saved " << freqs.size() << " term frequencies to " << output_path << std::endl;
    return true;
}
