#include "TopicPipeline.hpp"
#include "errors.hpp"
#include <iostream>
#include <filesystem>
#include <string>
#include <algorithm>

using namespace std;
namespace fs = std::filesystem;

// Usage: build_tfidf <tokens.jsonl> [output_dir] [config.json]
int main(int argc, char* argv[]) {
    string input_path = "data/processed/tokens.jsonl";
    string output_dir;
    string config_path;

    if (argc >= 2) input_path = argv[1];
    if (argc >= 3) output_dir = argv[2];
    if (argc >= 4) config_path = argv[3];

    try {
        SweepConfig config = config_path.empty() ? SweepConfig() : SweepConfig::load(config_path);
        if (!output_dir.empty()) config.output_dir = output_dir;

        cout << "Building TF-IDF from: " << input_path << "\n";
        cout << "Output: " << config.output_dir << "\n\n";

        TokenStreamReader reader;
        auto tokens = reader.read_file(input_path);

        TopicPipeline pipeline(config);
        VocabularyFilter filter = pipeline.make_frequency_filter();
        FrequencyAggregator aggregator;
        FrequencyTable table = aggregator.aggregate(filter.apply(tokens), document_ids_of(tokens));

        TfIdfEngine engine;
        auto records = engine.compute(table);
        auto top = engine.top_terms(records, config.top_n_terms);

        fs::path out(config.output_dir);
        bool ok = engine.save_table(records, (out / "tfidf.json").string());
        ok = engine.save_top_terms(top, (out / "top_terms.json").string()) && ok;
        ok = aggregator.save_term_frequencies(table, (out / "term_frequencies.json").string()) && ok;
        if (!ok) {
            cerr << "Error: Failed to write TF-IDF artifacts\n";
            return 1;
        }

        cout << "\nTF-IDF built successfully!\n";
        cout << "Documents: " << table.word_counts.size() << ", rows: " << records.size() << "\n";
        if (!table.empty_documents.empty()) {
            cout << "Documents with no surviving tokens: " << table.empty_documents.size() << "\n";
        }

        auto freqs = table.term_frequencies();
        cout << "\nMost frequent terms:\n";
        for (size_t i = 0; i < min<size_t>(10, freqs.size()); ++i) {
            cout << "  [" << i << "] " << freqs[i].first << " (" << freqs[i].second << ")\n";
        }

    } catch (const EmptyDocumentError& e) {
        cerr << "ERROR: " << e.what() << "\n";
        return 2;
    } catch (const exception& e) {
        cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
