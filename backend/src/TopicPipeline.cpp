#include "TopicPipeline.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <iomanip>

TopicPipeline::TopicPipeline(SweepConfig config) : config_(std::move(config)) {
    config_.validate();
}

VocabularyFilter TopicPipeline::make_matrix_filter() const {
    FilterOptions opts = VocabularyFilter::matrix_preset();
    opts.min_length = config_.matrix_min_length;
    opts.punctuation_tags = std::unordered_set<std::string>(config_.punctuation_tags.begin(),
                                                            config_.punctuation_tags.end());
    VocabularyFilter filter(opts);
    if (!config_.stopwords_path.empty()) filter.load_stopwords_from_file(config_.stopwords_path);
    return filter;
}

VocabularyFilter TopicPipeline::make_frequency_filter() const {
    FilterOptions opts = VocabularyFilter::frequency_preset();
    opts.min_length = config_.frequency_min_length;
    opts.punctuation_tags = std::unordered_set<std::string>(config_.punctuation_tags.begin(),
                                                            config_.punctuation_tags.end());
    VocabularyFilter filter(opts);
    if (!config_.stopwords_path.empty()) filter.load_stopwords_from_file(config_.stopwords_path);
    return filter;
}

PreparedCorpus TopicPipeline::prepare(const std::vector<Token>& tokens) const {
    const auto corpus_documents = document_ids_of(tokens);
    FrequencyAggregator aggregator;
    PreparedCorpus corpus;

    // 1. Frequency view and TF-IDF
    VocabularyFilter frequency_filter = make_frequency_filter();
    corpus.frequency_table = aggregator.aggregate(frequency_filter.apply(tokens), corpus_documents);
    corpus.tfidf = TfIdfEngine().compute(corpus.frequency_table);

    // 2. Matrix view
    VocabularyFilter matrix_filter = make_matrix_filter();
    auto matrix_tokens = matrix_filter.apply(tokens);
    corpus.matrix_table = aggregator.aggregate(matrix_tokens, corpus_documents);
    corpus.vocabulary = matrix_filter.vocabulary(tokens);

    // 3. Split over the documents that have matrix terms
    CorpusSplitter splitter(config_.test_fraction, config_.seed);
    corpus.split = splitter.split(corpus.matrix_table.documents());

    // 4. One matrix per side, each with its own column set
    DocumentTermMatrixBuilder builder;
    corpus.train = builder.build(corpus.matrix_table, corpus.split.train);
    corpus.test = builder.build(corpus.matrix_table, corpus.split.test);
    return corpus;
}

PerplexityCurve TopicPipeline::sweep(const PreparedCorpus& corpus, ModelFitter& fitter) const {
    SweepOptions options;
    options.k_values = config_.k_values;
    options.workers = config_.workers;

    TopicModelSweep sweep(fitter, options);
    return sweep.run(corpus.train, corpus.test);
}

std::string TopicPipeline::cache_key(std::uint64_t token_hash) const {
    std::uint64_t hash = fnv1a_hash(config_.curve_settings().dump(), token_hash);

    // Stopword file contents matter, not only its path
    if (!config_.stopwords_path.empty()) {
        std::ifstream in(config_.stopwords_path);
        if (in.is_open()) {
            std::stringstream buffer;
            buffer << in.rdbuf();
            hash = fnv1a_hash(buffer.str(), hash);
        }
    }

    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << hash;
    return out.str();
}
