#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "core/candidate.h"
#include "core/image_corpus.h"
#include "test_images.h"

using namespace tessera::core;
using tessera::test::corpus_of_sizes;

namespace {

ImageCorpus ten_images() {
    return corpus_of_sizes({{10, 10}, {20, 10}, {10, 20}, {30, 30}, {15, 25},
                            {25, 15}, {40, 10}, {10, 40}, {12, 12}, {33, 21}});
}

void expect_valid_ids(const std::vector<uint32_t>& ids, const ImageCorpus& corpus, const ImageLimits& limits) {
    const std::set<uint32_t> unique(ids.begin(), ids.end());
    EXPECT_EQ(unique.size(), ids.size()) << "duplicate id";
    for (uint32_t id : ids) {
        EXPECT_TRUE(corpus.contains(id));
    }
    EXPECT_GE(ids.size(), std::min(limits.min_images, corpus.size()));
    EXPECT_LE(ids.size(), limits.max_images);
}

} // namespace

TEST(Candidate, RandomIndividualRespectsLimits) {
    const ImageCorpus corpus = ten_images();
    const ImageLimits limits{2, 6};
    Rng rng(42);
    std::set<size_t> sizes_seen;
    for (int i = 0; i < 200; ++i) {
        const Candidate c = create_random_individual(corpus, limits, rng);
        expect_valid_ids(c.image_ids, corpus, limits);
        EXPECT_EQ(c.fitness, 0.0);
        EXPECT_FALSE(c.layout.has_value());
        sizes_seen.insert(c.image_ids.size());
    }
    EXPECT_EQ(sizes_seen, (std::set<size_t>{2, 3, 4, 5, 6}));
}

TEST(Candidate, RandomIndividualClampsToCorpus) {
    const ImageCorpus corpus = corpus_of_sizes({{10, 10}, {20, 20}, {30, 30}});
    Rng rng(1);
    const Candidate c = create_random_individual(corpus, {5, 10}, rng);
    EXPECT_EQ(c.image_ids.size(), 3u);
}

TEST(Candidate, EnforceStopsWhenCorpusIsExhausted) {
    const ImageCorpus corpus = corpus_of_sizes({{10, 10}, {20, 20}, {30, 30}});
    Rng rng(7);
    std::vector<uint32_t> ids = {1};
    enforce_image_limits(ids, corpus, {5, 10}, rng);
    EXPECT_EQ(ids.size(), 3u);
    EXPECT_EQ(std::set<uint32_t>(ids.begin(), ids.end()), (std::set<uint32_t>{0, 1, 2}));
}

TEST(Candidate, EnforceTrimsAboveMaximum) {
    const ImageCorpus corpus = ten_images();
    Rng rng(3);
    std::vector<uint32_t> ids = {0, 1, 2, 3, 4, 5, 6, 7};
    enforce_image_limits(ids, corpus, {1, 4}, rng);
    EXPECT_EQ(ids.size(), 4u);
    expect_valid_ids(ids, corpus, {1, 4});
}

TEST(Candidate, CrossoverKeepsInvariant) {
    const ImageCorpus corpus = ten_images();
    const ImageLimits limits{3, 5};
    Rng rng(11);
    for (int i = 0; i < 300; ++i) {
        const Candidate a = create_random_individual(corpus, limits, rng);
        const Candidate b = create_random_individual(corpus, limits, rng);
        const Candidate child = crossover(a, b, corpus, limits, rng);
        expect_valid_ids(child.image_ids, corpus, limits);
        EXPECT_TRUE(std::is_sorted(child.image_ids.begin(), child.image_ids.end()));
    }
}

TEST(Candidate, CrossoverOfEmptyParentsIsEmpty) {
    const ImageCorpus corpus = ten_images();
    Rng rng(5);
    const Candidate child = crossover(Candidate{}, Candidate{}, corpus, {2, 4}, rng);
    EXPECT_TRUE(child.image_ids.empty());
}

TEST(Candidate, MutationKeepsInvariantAndClearsScore) {
    const ImageCorpus corpus = ten_images();
    const ImageLimits limits{2, 4};
    Rng rng(19);
    for (int i = 0; i < 300; ++i) {
        Candidate c = create_random_individual(corpus, limits, rng);
        c.fitness = 1.5;
        c.layout = PackedLayout{};
        mutate(c, corpus, limits, rng);
        expect_valid_ids(c.image_ids, corpus, limits);
        EXPECT_EQ(c.fitness, 0.0);
        EXPECT_FALSE(c.layout.has_value());
    }
}

TEST(Candidate, MutationChangesSomething) {
    const ImageCorpus corpus = ten_images();
    const ImageLimits limits{1, 10};
    Rng rng(23);
    int changed = 0;
    for (int i = 0; i < 100; ++i) {
        Candidate c;
        c.image_ids = {0, 1, 2};
        mutate(c, corpus, limits, rng);
        if (c.image_ids != std::vector<uint32_t>{0, 1, 2}) {
            ++changed;
        }
    }
    EXPECT_EQ(changed, 100);
}

TEST(Candidate, MutatingEmptyCandidateOnlyRepairs) {
    const ImageCorpus corpus = ten_images();
    Rng rng(29);
    Candidate c;
    mutate(c, corpus, {2, 3}, rng);
    EXPECT_EQ(c.image_ids.size(), 2u);
}
