#include <gtest/gtest.h>
#include <algorithm>
#include <iterator>
#include <set>
#include "CorpusSplitter.hpp"
#include "errors.hpp"

static std::vector<std::string> numbered_docs(int n) {
    std::vector<std::string> docs;
    for (int i = 0; i < n; ++i) docs.push_back("doc" + std::to_string(i));
    return docs;
}

TEST(CorpusSplitterTest, SameSeedGivesSameSplit) {
    auto docs = numbered_docs(50);
    CorpusSplitter splitter(0.2, 42);

    auto first = splitter.split(docs);
    auto second = splitter.split(docs);

    EXPECT_EQ(first.train, second.train);
    EXPECT_EQ(first.test, second.test);
}

TEST(CorpusSplitterTest, InputOrderDoesNotMatter) {
    auto docs = numbered_docs(30);
    auto reversed = docs;
    std::reverse(reversed.begin(), reversed.end());

    CorpusSplitter splitter(0.2, 42);
    EXPECT_EQ(splitter.split(docs).test, splitter.split(reversed).test);
}

TEST(CorpusSplitterTest, PartitionIsDisjointAndComplete) {
    auto docs = numbered_docs(23);
    auto split = CorpusSplitter(0.2, 7).split(docs);

    EXPECT_EQ(split.test.size(), 5u);   // ceil(0.2 * 23)
    EXPECT_EQ(split.train.size(), 18u);

    std::vector<std::string> overlap;
    std::set_intersection(split.train.begin(), split.train.end(), split.test.begin(), split.test.end(),
                          std::back_inserter(overlap));
    EXPECT_TRUE(overlap.empty());

    std::set<std::string> all(split.train.begin(), split.train.end());
    all.insert(split.test.begin(), split.test.end());
    EXPECT_EQ(all, std::set<std::string>(docs.begin(), docs.end()));
}

TEST(CorpusSplitterTest, TestSizeIsCeilingOfFractionTimesN) {
    EXPECT_EQ(CorpusSplitter(0.2, 1).test_size(5), 1u);
    EXPECT_EQ(CorpusSplitter(0.2, 1).test_size(6), 2u);
    EXPECT_EQ(CorpusSplitter(0.1, 1).test_size(30), 3u);
    EXPECT_EQ(CorpusSplitter(0.5, 1).test_size(2), 1u);
}

TEST(CorpusSplitterTest, DifferentSeedsUsuallyDiffer) {
    auto docs = numbered_docs(100);
    auto a = CorpusSplitter(0.2, 1).split(docs);
    auto b = CorpusSplitter(0.2, 2).split(docs);
    EXPECT_NE(a.test, b.test);
}

TEST(CorpusSplitterTest, InvalidFractionOrTooFewDocumentsThrow) {
    auto docs = numbered_docs(10);
    EXPECT_THROW(CorpusSplitter(0.0, 42).split(docs), InvalidSplitError);
    EXPECT_THROW(CorpusSplitter(1.0, 42).split(docs), InvalidSplitError);
    EXPECT_THROW(CorpusSplitter(-0.5, 42).split(docs), InvalidSplitError);
    EXPECT_THROW(CorpusSplitter(0.2, 42).split({"only"}), InvalidSplitError);
    // Duplicates collapse to one document
    EXPECT_THROW(CorpusSplitter(0.2, 42).split({"same", "same"}), InvalidSplitError);
}

TEST(CorpusSplitterTest, EmptyTrainSideThrows) {
    // ceil(0.9 * 2) = 2 leaves nothing to train on
    EXPECT_THROW(CorpusSplitter(0.9, 42).split({"a", "b"}), InvalidSplitError);
}

TEST(CorpusSplitterTest, ErrorCarriesParameters) {
    try {
        CorpusSplitter(1.5, 42).split(numbered_docs(4));
        FAIL() << "expected InvalidSplitError";
    } catch (const InvalidSplitError& e) {
        EXPECT_DOUBLE_EQ(e.fraction(), 1.5);
        EXPECT_EQ(e.document_count(), 4u);
    }
}
