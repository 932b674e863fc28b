#ifndef TOKEN_STREAM_HPP
#define TOKEN_STREAM_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// One tagged token produced by the external lemmatizer
struct Token {
    std::string document_id;
    std::string surface;
    std::string lemma;
    std::string pos;
};

// Summary of one read of a token file
struct TokenStreamStats {
    std::size_t lines_read = 0;
    std::size_t lines_skipped = 0;      // Malformed or missing required fields
    std::size_t documents = 0;          // Distinct document ids
    std::uint64_t content_hash = 0;     // FNV-1a over every line, used as cache key input
};

// Reads the precomputed token stream (JSONL, one token per line).
// Accepted keys: document_id|doc_id, surface|token, lemma, pos|upos.
class TokenStreamReader {
public:
    TokenStreamReader();

    // Throws TokenStreamError if the file cannot be opened
    std::vector<Token> read_file(const std::string& path);

    // Parses tokens from an already open stream (used by tests)
    std::vector<Token> read_stream(std::istream& in);

    const TokenStreamStats& stats() const { return stats_; }

private:
    TokenStreamStats stats_;

    bool parse_line(const std::string& line, Token& out) const;
};

// Distinct document ids in first-seen order
std::vector<std::string> document_ids_of(const std::vector<Token>& tokens);

// 64-bit FNV-1a, chained through `seed`
std::uint64_t fnv1a_hash(const std::string& data, std::uint64_t seed = 1469598103934665603ULL);

#endif // TOKEN_STREAM_HPP
