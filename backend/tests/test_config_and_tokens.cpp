#include <gtest/gtest.h>
#include <sstream>
#include "SweepConfig.hpp"
#include "token_stream.hpp"
#include "errors.hpp"

TEST(SweepConfigTest, DefaultsApplyForMissingKeys) {
    auto config = SweepConfig::from_json(json::object());
    EXPECT_DOUBLE_EQ(config.test_fraction, 0.2);
    EXPECT_EQ(config.seed, 42u);
    EXPECT_EQ(config.k_values.front(), 2);
    EXPECT_EQ(config.matrix_min_length, 3u);
    EXPECT_EQ(config.punctuation_tags, (std::vector<std::string>{"PUNCT"}));
}

TEST(SweepConfigTest, ValuesAreRead) {
    auto config = SweepConfig::from_json({
        {"test_fraction", 0.25},
        {"seed", 7},
        {"k_values", {2, 3}},
        {"workers", 2},
        {"fit_timeout_seconds", 30},
        {"fit_command", "python3 fit_lda.py"},
        {"top_n_terms", 5}
    });
    EXPECT_DOUBLE_EQ(config.test_fraction, 0.25);
    EXPECT_EQ(config.seed, 7u);
    EXPECT_EQ(config.k_values, (std::vector<int>{2, 3}));
    EXPECT_EQ(config.workers, 2u);
    EXPECT_EQ(config.fit_timeout_seconds, 30);
    EXPECT_EQ(config.fit_command, "python3 fit_lda.py");
    EXPECT_EQ(config.top_n_terms, 5u);
}

TEST(SweepConfigTest, InvalidValuesAreRejected) {
    EXPECT_THROW(SweepConfig::from_json({{"test_fraction", 1.0}}), ConfigError);
    EXPECT_THROW(SweepConfig::from_json({{"k_values", {3, 2}}}), ConfigError);
    EXPECT_THROW(SweepConfig::from_json({{"k_values", json::array()}}), ConfigError);
    EXPECT_THROW(SweepConfig::from_json({{"seed", "abc"}}), ConfigError);
    EXPECT_THROW(SweepConfig::from_json(json::array()), ConfigError);
    EXPECT_THROW(SweepConfig::load("/nonexistent/config.json"), ConfigError);
}

TEST(SweepConfigTest, CurveSettingsTrackResultAffectingKeys) {
    SweepConfig a;
    SweepConfig b;
    EXPECT_EQ(a.curve_settings(), b.curve_settings());
    b.seed = 43;
    EXPECT_NE(a.curve_settings(), b.curve_settings());
    SweepConfig c;
    c.output_dir = "elsewhere";
    EXPECT_EQ(a.curve_settings(), c.curve_settings());
    // The timeout decides which K values fail
    SweepConfig d;
    d.fit_timeout_seconds = 600;
    EXPECT_NE(a.curve_settings(), d.curve_settings());
}

TEST(SweepConfigTest, NegativeCountsAreRejected) {
    EXPECT_THROW(SweepConfig::from_json({{"seed", -1}}), ConfigError);
    EXPECT_THROW(SweepConfig::from_json({{"workers", -2}}), ConfigError);
    EXPECT_THROW(SweepConfig::from_json({{"top_n_terms", -5}}), ConfigError);
    EXPECT_EQ(SweepConfig::from_json({{"seed", 0}}).seed, 0u);
}

TEST(TokenStreamTest, ParsesAcceptedKeyVariants) {
    std::istringstream in(
        "{\"document_id\": \"W1\", \"surface\": \"Fisheries\", \"lemma\": \"fishery\", \"pos\": \"NOUN\"}\n"
        "{\"doc_id\": 17, \"token\": \"were\", \"lemma\": \"be\", \"upos\": \"AUX\"}\n"
        "\n"
        "{\"document_id\": \"W2\", \"lemma\": \"salmon\"}\n");

    TokenStreamReader reader;
    auto tokens = reader.read_stream(in);

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].document_id, "W1");
    EXPECT_EQ(tokens[0].surface, "Fisheries");
    EXPECT_EQ(tokens[0].lemma, "fishery");
    EXPECT_EQ(tokens[1].document_id, "17");
    EXPECT_EQ(tokens[1].surface, "were");
    EXPECT_EQ(tokens[1].pos, "AUX");
    EXPECT_EQ(tokens[2].surface, "salmon");
    EXPECT_EQ(reader.stats().documents, 3u);
    EXPECT_EQ(reader.stats().lines_skipped, 0u);
}

TEST(TokenStreamTest, MalformedLinesAreSkippedAndCounted) {
    std::istringstream in(
        "not json\n"
        "{\"document_id\": \"W1\"}\n"
        "{\"document_id\": \"W1\", \"lemma\": \"kelp\"}\n");

    TokenStreamReader reader;
    auto tokens = reader.read_stream(in);

    EXPECT_EQ(tokens.size(), 1u);
    EXPECT_EQ(reader.stats().lines_read, 3u);
    EXPECT_EQ(reader.stats().lines_skipped, 2u);
}

TEST(TokenStreamTest, ContentHashFollowsContent) {
    std::istringstream a("{\"document_id\": \"W1\", \"lemma\": \"kelp\"}\n");
    std::istringstream b("{\"document_id\": \"W1\", \"lemma\": \"kelp\"}\n");
    std::istringstream c("{\"document_id\": \"W1\", \"lemma\": \"reef\"}\n");

    TokenStreamReader ra, rb, rc;
    ra.read_stream(a);
    rb.read_stream(b);
    rc.read_stream(c);

    EXPECT_EQ(ra.stats().content_hash, rb.stats().content_hash);
    EXPECT_NE(ra.stats().content_hash, rc.stats().content_hash);
}

TEST(TokenStreamTest, MissingFileThrows) {
    TokenStreamReader reader;
    EXPECT_THROW(reader.read_file("/nonexistent/tokens.jsonl"), TokenStreamError);
}

TEST(TokenStreamTest, DocumentIdsInFirstSeenOrder) {
    std::vector<Token> tokens{{"b", "x", "x", ""}, {"a", "y", "y", ""}, {"b", "z", "z", ""}};
    EXPECT_EQ(document_ids_of(tokens), (std::vector<std::string>{"b", "a"}));
}
