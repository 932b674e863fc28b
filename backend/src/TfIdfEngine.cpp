#include "TfIdfEngine.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

TfIdfEngine::TfIdfEngine() {}

std::map<std::string, double> TfIdfEngine::inverse_document_frequency(const FrequencyTable& table) const {
    // n_t: number of distinct documents containing t
    std::map<std::string, int> doc_freq;
    for (const auto& [doc_id, lemmas] : table.term_counts) {
        for (const auto& [lemma, count] : lemmas) {
            if (count > 0) doc_freq[lemma]++;
        }
    }

    const double n_docs = static_cast<double>(table.term_counts.size());
    std::map<std::string, double> idf;
    for (const auto& [lemma, n_t] : doc_freq) {
        // Exact zero when the term is in every document
        idf[lemma] = (n_t == static_cast<int>(table.term_counts.size()))
                         ? 0.0
                         : std::log(n_docs / static_cast<double>(n_t));
    }
    return idf;
}

std::vector<TfIdfRecord> TfIdfEngine::compute(const FrequencyTable& table) const {
    for (const auto& [doc_id, lemmas] : table.term_counts) {
        if (table.word_count(doc_id) <= 0) {
            throw EmptyDocumentError(doc_id);
        }
    }

    const auto idf = inverse_document_frequency(table);

    std::vector<TfIdfRecord> records;
    records.reserve(table.row_count());
    for (const auto& [doc_id, lemmas] : table.term_counts) {
        const double word_ct = static_cast<double>(table.word_count(doc_id));
        for (const auto& [lemma, count] : lemmas) {
            TfIdfRecord rec;
            rec.document_id = doc_id;
            rec.lemma = lemma;
            rec.tf = static_cast<double>(count) / word_ct;
            rec.idf = idf.at(lemma);
            rec.tfidf = rec.tf * rec.idf;
            records.push_back(std::move(rec));
        }
    }

    std::cout << "[TfIdfEngine] Scored " << records.size() << " rows over "
              << table.term_counts.size() << " documents, " << idf.size() << " terms" << std::endl;
    return records;
}

std::map<std::string, std::vector<TfIdfRecord>> TfIdfEngine::top_terms(const std::vector<TfIdfRecord>& records,
                                                                       size_t n) const {
    std::map<std::string, std::vector<TfIdfRecord>> by_doc;
    for (const auto& rec : records) by_doc[rec.document_id].push_back(rec);

    for (auto& [doc_id, recs] : by_doc) {
        std::sort(recs.begin(), recs.end(), [](const TfIdfRecord& a, const TfIdfRecord& b) {
            if (a.tfidf != b.tfidf) return a.tfidf > b.tfidf;
            return a.lemma < b.lemma;
        });
        if (recs.size() > n) recs.resize(n);
    }
    return by_doc;
}

static json record_to_json(const TfIdfRecord& rec) {
    return {
        {"document_id", rec.document_id},
        {"lemma", rec.lemma},
        {"tf", rec.tf},
        {"idf", rec.idf},
        {"tfidf", rec.tfidf}
    };
}

static bool write_json(const json& j, const std::string& output_path) {
    fs::path outp(output_path);
    if (outp.has_parent_path()) fs::create_directories(outp.parent_path());

    std::ofstream out(output_path);
    if (!out.is_open()) {
        std::cerr << "[TfIdfEngine] Error: could not create file " << output_path << std::endl;
        return false;
    }
    out << j.dump(2) << "\n";
    return out.good();
}

bool TfIdfEngine::save_table(const std::vector<TfIdfRecord>& records, const std::string& output_path) const {
    json j = json::array();
    for (const auto& rec : records) j.push_back(record_to_json(rec));

    if (!write_json(j, output_path)) return false;
    std::cout << "[TfIdfEngine] Saved TF-IDF table to " << output_path << std::endl;
    return true;
}

bool TfIdfEngine::save_top_terms(const std::map<std::string, std::vector<TfIdfRecord>>& top,
                                 const std::string& output_path) const {
    json j = json::object();
    for (const auto& [doc_id, recs] : top) {
        json terms = json::array();
        for (const auto& rec : recs) terms.push_back({{"lemma", rec.lemma}, {"tfidf", rec.tfidf}});
        j[doc_id] = terms;
    }

    if (!write_json(j, output_path)) return false;
    std::cout << "[TfIdfEngine] Saved top terms for " << top.size() << " documents to " << output_path << std::endl;
    return true;
}
