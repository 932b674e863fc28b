#include "token_stream.hpp"
#include "errors.hpp"
#include <fstream>
#include <iostream>
#include <unordered_set>

TokenStreamReader::TokenStreamReader() {}

std::uint64_t fnv1a_hash(const std::string& data, std::uint64_t seed) {
    std::uint64_t hash = seed;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

// Read the whole token file once
std::vector<Token> TokenStreamReader::read_file(const std::string& path) {
    std::cout << "[TokenStream] Reading tokens from: " << path << std::endl;
    std::ifstream in(path);
    if (!in.is_open()) {
        throw TokenStreamError("Could not open token file: " + path);
    }
    return read_stream(in);
}

std::vector<Token> TokenStreamReader::read_stream(std::istream& in) {
    stats_ = TokenStreamStats{};
    std::uint64_t hash = fnv1a_hash("");

    std::vector<Token> tokens;
    std::unordered_set<std::string> seen_docs;
    std::string line;

    while (std::getline(in, line)) {
        if (line.empty()) continue;
        stats_.lines_read++;
        hash = fnv1a_hash(line + "\n", hash);

        Token token;
        if (!parse_line(line, token)) {
            stats_.lines_skipped++;
            continue;
        }
        seen_docs.insert(token.document_id);
        tokens.push_back(std::move(token));

        if (stats_.lines_read % 100000 == 0) {
            std::cout << "[TokenStream] Read " << stats_.lines_read << " lines..." << std::endl;
        }
    }

    stats_.documents = seen_docs.size();
    stats_.content_hash = hash;

    if (stats_.lines_skipped > 0) {
        std::cerr << "[TokenStream] Warning: skipped " << stats_.lines_skipped
                  << " malformed lines" << std::endl;
    }
    std::cout << "[TokenStream] Loaded " << tokens.size() << " tokens from "
              << stats_.documents << " documents" << std::endl;
    return tokens;
}

// Parse one JSONL record, false if it is unusable
bool TokenStreamReader::parse_line(const std::string& line, Token& out) const {
    try {
        json j = json::parse(line);
        if (!j.is_object()) return false;

        // Document ids may be numeric in some exports
        const char* id_key = j.contains("document_id") ? "document_id" : "doc_id";
        if (!j.contains(id_key)) return false;
        const json& id = j[id_key];
        if (id.is_string()) {
            out.document_id = id.get<std::string>();
        } else if (id.is_number_integer()) {
            out.document_id = std::to_string(id.get<long long>());
        } else {
            return false;
        }

        if (!j.contains("lemma") || !j["lemma"].is_string()) return false;
        out.lemma = j["lemma"].get<std::string>();

        if (j.contains("surface") && j["surface"].is_string()) {
            out.surface = j["surface"].get<std::string>();
        } else if (j.contains("token") && j["token"].is_string()) {
            out.surface = j["token"].get<std::string>();
        } else {
            out.surface = out.lemma;
        }

        if (j.contains("pos") && j["pos"].is_string()) {
            out.pos = j["pos"].get<std::string>();
        } else if (j.contains("upos") && j["upos"].is_string()) {
            out.pos = j["upos"].get<std::string>();
        }
        return !out.document_id.empty();
    } catch (const json::exception&) {
        return false;
    }
}

std::vector<std::string> document_ids_of(const std::vector<Token>& tokens) {
    std::vector<std::string> ids;
    std::unordered_set<std::string> seen;
    for (const auto& token : tokens) {
        if (seen.insert(token.document_id).second) ids.push_back(token.document_id);
    }
    return ids;
}
