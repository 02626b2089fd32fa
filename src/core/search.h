#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "candidate.h"
#include "fitness.h"

namespace tessera::core {

class ImageCorpus;

enum class SearchMode {
    // Independent random subsets; keeps the layout with the least free area.
    Trials,
    // Generational population with elitism, crossover and mutation.
    Genetic
};

struct SearchConfig {
    SearchMode mode = SearchMode::Genetic;
    ImageLimits limits{1, 1};
    size_t num_trials = 1000;
    size_t trial_batch_size = 256;
    double stop_free_percent = 0.0;
    size_t population_size = 50;
    size_t generations = 100;
    double mutation_rate = 0.2;
    double crossover_rate = 0.7;
    FitnessParams fitness;
    unsigned int threads = 0;
    uint64_t seed = 0;
};

struct SearchProgress {
    SearchMode mode = SearchMode::Genetic;
    size_t step = 0;
    size_t total = 0;
    bool has_best = false;
    bool improved = false;
    LayoutScore best;
};

using ProgressCallback = std::function<void(const SearchProgress&)>;

struct SearchResult {
    Candidate best;
    LayoutScore score;
    size_t evaluations = 0;
};

bool parse_search_mode(const std::string& value, SearchMode& out, std::string& error);
const char* search_mode_name(SearchMode mode);

bool validate_search_config(const SearchConfig& config, std::string& error);

// Monte-Carlo ordering: smaller free area wins, then smaller aspect deviation.
bool is_better_trial(const LayoutScore& candidate, const LayoutScore& best);

// Evaluates candidates[begin, end) on the worker pool. Returns after every
// evaluation has finished.
void evaluate_range(std::vector<Candidate>& candidates,
                    size_t begin,
                    size_t end,
                    const ImageCorpus& corpus,
                    const FitnessParams& params,
                    unsigned int threads);

// Highest fitness first; stable so equal candidates keep their order.
void sort_by_fitness(std::vector<Candidate>& population);

bool run_trials(const ImageCorpus& corpus,
                const SearchConfig& config,
                SearchResult& out,
                std::string& error,
                const ProgressCallback& progress = {});

bool run_genetic(const ImageCorpus& corpus,
                 const SearchConfig& config,
                 SearchResult& out,
                 std::string& error,
                 const ProgressCallback& progress = {});

bool run_search(const ImageCorpus& corpus,
                const SearchConfig& config,
                SearchResult& out,
                std::string& error,
                const ProgressCallback& progress = {});

} // namespace tessera::core
