#include <gtest/gtest.h>

#include <vector>

#include "core/image_corpus.h"
#include "core/search.h"
#include "test_images.h"

using namespace tessera::core;
using tessera::test::corpus_of_sizes;

namespace {

ImageCorpus mixed_corpus() {
    return corpus_of_sizes({{100, 100}, {150, 100}, {100, 150}, {200, 200}, {60, 90},
                            {90, 60}, {120, 120}, {80, 40}, {40, 80}, {70, 70}});
}

SearchConfig small_genetic_config() {
    SearchConfig config;
    config.mode = SearchMode::Genetic;
    config.limits = {2, 6};
    config.population_size = 12;
    config.generations = 8;
    config.threads = 4;
    config.seed = 1234;
    return config;
}

SearchConfig small_trials_config() {
    SearchConfig config;
    config.mode = SearchMode::Trials;
    config.limits = {2, 6};
    config.num_trials = 100;
    config.trial_batch_size = 16;
    config.threads = 4;
    config.seed = 99;
    return config;
}

bool same_layout(const PackedLayout& a, const PackedLayout& b) {
    if (a.canvas_width != b.canvas_width || a.canvas_height != b.canvas_height ||
        a.placements.size() != b.placements.size()) {
        return false;
    }
    for (size_t i = 0; i < a.placements.size(); ++i) {
        const Rect& ra = a.placements[i].rect;
        const Rect& rb = b.placements[i].rect;
        if (a.placements[i].image_id != b.placements[i].image_id || ra.x != rb.x || ra.y != rb.y ||
            ra.w != rb.w || ra.h != rb.h) {
            return false;
        }
    }
    return true;
}

} // namespace

TEST(SearchMode, ParsesNamesAndAliases) {
    SearchMode mode = SearchMode::Genetic;
    std::string error;
    ASSERT_TRUE(parse_search_mode("trials", mode, error));
    EXPECT_EQ(mode, SearchMode::Trials);
    ASSERT_TRUE(parse_search_mode("GA", mode, error));
    EXPECT_EQ(mode, SearchMode::Genetic);
    EXPECT_FALSE(parse_search_mode("annealing", mode, error));
    EXPECT_FALSE(error.empty());
}

TEST(ValidateSearchConfig, RejectsBadValues) {
    std::string error;
    SearchConfig config = small_genetic_config();
    EXPECT_TRUE(validate_search_config(config, error));

    config.limits = {5, 3};
    EXPECT_FALSE(validate_search_config(config, error));

    config = small_genetic_config();
    config.mutation_rate = 1.5;
    EXPECT_FALSE(validate_search_config(config, error));

    config = small_genetic_config();
    config.population_size = 0;
    EXPECT_FALSE(validate_search_config(config, error));

    config = small_genetic_config();
    config.fitness.desired_aspect_ratio = 0.0;
    EXPECT_FALSE(validate_search_config(config, error));

    config = small_trials_config();
    config.num_trials = 0;
    EXPECT_FALSE(validate_search_config(config, error));
}

TEST(IsBetterTrial, FreeAreaThenAspect) {
    LayoutScore best;
    best.free_area = 100;
    best.aspect_diff = 0.5;
    LayoutScore candidate = best;
    candidate.free_area = 90;
    candidate.aspect_diff = 2.0;
    EXPECT_TRUE(is_better_trial(candidate, best));
    candidate.free_area = 100;
    candidate.aspect_diff = 0.4;
    EXPECT_TRUE(is_better_trial(candidate, best));
    candidate.aspect_diff = 0.5;
    EXPECT_FALSE(is_better_trial(candidate, best));
}

TEST(SortByFitness, DescendingAndStable) {
    std::vector<Candidate> population(4);
    population[0].fitness = 1.0;
    population[0].image_ids = {0};
    population[1].fitness = 3.0;
    population[2].fitness = 1.0;
    population[2].image_ids = {2};
    population[3].fitness = 2.0;
    sort_by_fitness(population);
    EXPECT_EQ(population[0].fitness, 3.0);
    EXPECT_EQ(population[1].fitness, 2.0);
    EXPECT_EQ(population[2].image_ids, std::vector<uint32_t>{0});
    EXPECT_EQ(population[3].image_ids, std::vector<uint32_t>{2});
}

TEST(EvaluateRange, OnlyTouchesRequestedSlots) {
    const ImageCorpus corpus = mixed_corpus();
    std::vector<Candidate> candidates(6);
    for (size_t i = 0; i < candidates.size(); ++i) {
        candidates[i].image_ids = {static_cast<uint32_t>(i)};
    }
    evaluate_range(candidates, 2, 5, corpus, FitnessParams{}, 3);
    EXPECT_FALSE(candidates[0].layout.has_value());
    EXPECT_FALSE(candidates[1].layout.has_value());
    EXPECT_TRUE(candidates[2].layout.has_value());
    EXPECT_TRUE(candidates[4].layout.has_value());
    EXPECT_FALSE(candidates[5].layout.has_value());
}

TEST(RunGenetic, BestFitnessNeverDecreases) {
    const ImageCorpus corpus = mixed_corpus();
    std::vector<double> bests;
    SearchResult result;
    std::string error;
    ASSERT_TRUE(run_genetic(corpus, small_genetic_config(), result, error, [&](const SearchProgress& update) {
        EXPECT_EQ(update.mode, SearchMode::Genetic);
        if (update.has_best) {
            bests.push_back(update.best.fitness);
        }
    })) << error;
    ASSERT_EQ(bests.size(), 9u);
    for (size_t i = 1; i < bests.size(); ++i) {
        EXPECT_GE(bests[i], bests[i - 1]);
    }
    EXPECT_DOUBLE_EQ(result.score.fitness, bests.back());
    EXPECT_EQ(result.evaluations, 12u + 8u * 6u);
}

TEST(RunGenetic, WinnerRespectsLimitsAndIsDisjoint) {
    const ImageCorpus corpus = mixed_corpus();
    const SearchConfig config = small_genetic_config();
    SearchResult result;
    std::string error;
    ASSERT_TRUE(run_genetic(corpus, config, result, error)) << error;
    ASSERT_TRUE(result.best.layout.has_value());
    const PackedLayout& layout = *result.best.layout;
    EXPECT_GE(layout.placements.size(), config.limits.min_images);
    EXPECT_LE(layout.placements.size(), config.limits.max_images);
    for (size_t i = 0; i < layout.placements.size(); ++i) {
        for (size_t j = i + 1; j < layout.placements.size(); ++j) {
            EXPECT_FALSE(rects_intersect(layout.placements[i].rect, layout.placements[j].rect));
        }
    }
}

TEST(RunGenetic, SameSeedSameLayout) {
    const ImageCorpus corpus = mixed_corpus();
    SearchConfig config = small_genetic_config();
    SearchResult first;
    SearchResult second;
    std::string error;
    ASSERT_TRUE(run_genetic(corpus, config, first, error)) << error;
    config.threads = 1;
    ASSERT_TRUE(run_genetic(corpus, config, second, error)) << error;
    EXPECT_EQ(first.best.image_ids, second.best.image_ids);
    EXPECT_TRUE(same_layout(*first.best.layout, *second.best.layout));
}

TEST(RunTrials, SameSeedSameLayout) {
    const ImageCorpus corpus = mixed_corpus();
    SearchConfig config = small_trials_config();
    SearchResult first;
    SearchResult second;
    std::string error;
    ASSERT_TRUE(run_trials(corpus, config, first, error)) << error;
    config.threads = 1;
    ASSERT_TRUE(run_trials(corpus, config, second, error)) << error;
    EXPECT_EQ(first.best.image_ids, second.best.image_ids);
    EXPECT_TRUE(same_layout(*first.best.layout, *second.best.layout));
    EXPECT_EQ(first.evaluations, 100u);
}

TEST(RunTrials, ReportsEveryBatch) {
    const ImageCorpus corpus = mixed_corpus();
    std::vector<size_t> steps;
    SearchResult result;
    std::string error;
    ASSERT_TRUE(run_trials(corpus, small_trials_config(), result, error, [&](const SearchProgress& update) {
        steps.push_back(update.step);
        EXPECT_EQ(update.total, 100u);
    })) << error;
    EXPECT_EQ(steps, (std::vector<size_t>{16, 32, 48, 64, 80, 96, 100}));
}

TEST(RunTrials, StopsEarlyOnFreeTarget) {
    // Identical squares in a single-image collage leave no free area.
    const ImageCorpus corpus = corpus_of_sizes({{50, 50}, {50, 50}});
    SearchConfig config = small_trials_config();
    config.limits = {1, 1};
    config.stop_free_percent = 0.5;
    SearchResult result;
    std::string error;
    ASSERT_TRUE(run_trials(corpus, config, result, error)) << error;
    EXPECT_EQ(result.evaluations, config.trial_batch_size);
    EXPECT_EQ(result.score.free_area, 0u);
}

TEST(RunSearch, FailsWithoutPackableLayout) {
    const ImageCorpus corpus = corpus_of_sizes({{100, 100}});
    SearchConfig config = small_trials_config();
    config.limits = {1, 1};
    config.fitness.desired_aspect_ratio = 0.01;
    config.fitness.pack.max_attempts = 1;
    SearchResult result;
    std::string error;
    EXPECT_FALSE(run_search(corpus, config, result, error));
    EXPECT_EQ(error, "no suitable layout found");

    config.mode = SearchMode::Genetic;
    error.clear();
    EXPECT_FALSE(run_search(corpus, config, result, error));
    EXPECT_EQ(error, "no suitable layout found");
}

TEST(RunSearch, FailsOnEmptyCorpus) {
    const ImageCorpus corpus;
    SearchResult result;
    std::string error;
    EXPECT_FALSE(run_search(corpus, small_genetic_config(), result, error));
    EXPECT_EQ(error, "no valid images found");
}
