#include "VocabularyFilter.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <set>

using namespace std;

static string to_lower(const string& s) {
    string out = s;
    transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return tolower(c); });
    return out;
}

VocabularyFilter::VocabularyFilter(FilterOptions options) : options_(std::move(options)) {
    load_default_stopwords();
}

FilterOptions VocabularyFilter::matrix_preset() {
    FilterOptions opts;
    opts.name = "matrix";
    opts.strip_non_alpha = true;
    opts.drop_numeric = false;   // digits are stripped anyway
    return opts;
}

FilterOptions VocabularyFilter::frequency_preset() {
    FilterOptions opts;
    opts.name = "frequency";
    opts.strip_non_alpha = false;
    opts.drop_numeric = true;
    return opts;
}

// Default English stopwords
void VocabularyFilter::load_default_stopwords() {
    static const char* defaults[] = {
        "the","a","an","and","or","but","in","on","at","to","for","of","with","by","from",
        "as","is","was","are","were","be","been","being","have","has","had","do","does","did",
        "will","would","should","could","may","might","must","can","this","that","these","those",
        "i","you","he","she","it","we","they","me","him","her","us","them","my","your","his","its",
        "our","their","what","which","who","whom","when","where","why","how","all","any","each",
        "every","both","few","more","most","other","some","such","no","nor","not","only","own",
        "same","so","than","too","very","now","then","there","here","through","under","until",
        "up","down","out","over","into","onto","about","above","below","after","before","again",
        "further","once","also","just","because","while","if","between","during","against",
        "within","without","among","per","via","yet","however","thus","whether","either","neither"
    };
    stop_words_.clear();
    for (const auto& w : defaults) stop_words_.insert(string(w));
}

void VocabularyFilter::set_stopwords(const vector<string>& words) {
    stop_words_.clear();
    for (const auto& w : words) {
        if (!w.empty()) stop_words_.insert(to_lower(w));
    }
}

// One stopword per line, blank lines ignored
void VocabularyFilter::load_stopwords_from_file(const string& path) {
    ifstream in(path);
    if (!in.is_open()) throw ConfigError("Stopwords file not found: " + path);

    vector<string> words;
    string line;
    while (getline(in, line)) {
        auto start = line.find_first_not_of(" \t\r\n");
        if (start == string::npos) continue;
        auto end = line.find_last_not_of(" \t\r\n");
        words.push_back(line.substr(start, end - start + 1));
    }
    set_stopwords(words);
    cout << "[VocabularyFilter] Loaded " << stop_words_.size() << " stopwords from " << path << "\n";
}

bool VocabularyFilter::is_stopword(const string& word) const {
    return stop_words_.count(to_lower(word)) > 0;
}

string VocabularyFilter::normalize(const Token& token) const {
    if (options_.punctuation_tags.count(token.pos)) return "";

    string term = to_lower(token.lemma);
    if (options_.drop_stopwords && stop_words_.count(term)) return "";

    if (options_.drop_numeric &&
        any_of(term.begin(), term.end(), [](unsigned char c){ return isdigit(c) || c == '%'; })) {
        return "";
    }

    // Length is always judged on the letters alone
    string letters = term;
    letters.erase(remove_if(letters.begin(), letters.end(), [](unsigned char c){ return !(c >= 'a' && c <= 'z'); }),
                  letters.end());
    if (letters.empty() || letters.size() < options_.min_length) return "";

    if (options_.strip_non_alpha) {
        term = std::move(letters);
        if (options_.drop_stopwords && stop_words_.count(term)) return "";
    }
    return term;
}

vector<Token> VocabularyFilter::apply(const vector<Token>& tokens) const {
    vector<Token> kept;
    kept.reserve(tokens.size());
    for (const auto& token : tokens) {
        string term = normalize(token);
        if (term.empty()) continue;
        Token t = token;
        t.lemma = std::move(term);
        kept.push_back(std::move(t));
    }
    cout << "[VocabularyFilter] " << options_.name << " preset kept " << kept.size()
         << " of " << tokens.size() << " tokens\n";
    return kept;
}

vector<string> VocabularyFilter::vocabulary(const vector<Token>& tokens) const {
    set<string> terms;
    for (const auto& token : tokens) {
        string term = normalize(token);
        if (!term.empty()) terms.insert(term);
    }
    return vector<string>(terms.begin(), terms.end());
}
