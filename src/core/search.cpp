#include "search.h"

#include <algorithm>

#include "cli_parse.h"
#include "image_corpus.h"
#include "worker_pool.h"

namespace tessera::core {

bool parse_search_mode(const std::string& value, SearchMode& out, std::string& error) {
    const std::string lower = to_lower_copy(value);
    if (lower == "trials" || lower == "montecarlo" || lower == "random") {
        out = SearchMode::Trials;
        return true;
    }
    if (lower == "genetic" || lower == "ga") {
        out = SearchMode::Genetic;
        return true;
    }
    error = "invalid mode '" + value + "'";
    return false;
}

const char* search_mode_name(SearchMode mode) {
    switch (mode) {
        case SearchMode::Trials:
            return "trials";
        case SearchMode::Genetic:
            return "genetic";
    }
    return "unknown";
}

bool validate_search_config(const SearchConfig& config, std::string& error) {
    if (config.limits.min_images > config.limits.max_images) {
        error = "min_images (" + std::to_string(config.limits.min_images) + ") exceeds max_images (" +
                std::to_string(config.limits.max_images) + ")";
        return false;
    }
    if (config.mutation_rate < 0.0 || config.mutation_rate > 1.0) {
        error = "mutation_rate must be within [0, 1]";
        return false;
    }
    if (config.crossover_rate < 0.0 || config.crossover_rate > 1.0) {
        error = "crossover_rate must be within [0, 1]";
        return false;
    }
    const FitnessParams& fitness = config.fitness;
    if (!(fitness.desired_aspect_ratio > 0.0)) {
        error = "aspect ratio must be positive";
        return false;
    }
    if (fitness.aspect_weight < 0.0) {
        error = "aspect weight must not be negative";
        return false;
    }
    if (fitness.pack.padding < 0) {
        error = "padding must not be negative";
        return false;
    }
    if (fitness.pack.min_budget_side < 0) {
        error = "minimum canvas side must not be negative";
        return false;
    }
    if (fitness.pack.overflow == OverflowPolicy::GrowBudget) {
        if (!(fitness.pack.growth_factor > 1.0)) {
            error = "growth factor must be greater than 1";
            return false;
        }
        if (fitness.pack.max_attempts < 1) {
            error = "max attempts must be at least 1";
            return false;
        }
    }
    if (config.mode == SearchMode::Trials) {
        if (config.num_trials == 0) {
            error = "trial count must be at least 1";
            return false;
        }
        if (config.trial_batch_size == 0) {
            error = "trial batch size must be at least 1";
            return false;
        }
        if (config.stop_free_percent < 0.0) {
            error = "stop free percent must not be negative";
            return false;
        }
    } else {
        if (config.population_size == 0) {
            error = "population size must be at least 1";
            return false;
        }
        if (config.generations == 0) {
            error = "generation count must be at least 1";
            return false;
        }
    }
    return true;
}

bool is_better_trial(const LayoutScore& candidate, const LayoutScore& best) {
    if (candidate.free_area != best.free_area) {
        return candidate.free_area < best.free_area;
    }
    return candidate.aspect_diff < best.aspect_diff;
}

void evaluate_range(std::vector<Candidate>& candidates,
                    size_t begin,
                    size_t end,
                    const ImageCorpus& corpus,
                    const FitnessParams& params,
                    unsigned int threads) {
    end = std::min(end, candidates.size());
    parallel_for(begin, end, threads, [&](size_t idx) {
        evaluate(candidates[idx], corpus, params);
    });
}

void sort_by_fitness(std::vector<Candidate>& population) {
    std::stable_sort(population.begin(), population.end(), [](const Candidate& a, const Candidate& b) {
        return a.fitness > b.fitness;
    });
}

bool run_trials(const ImageCorpus& corpus,
                const SearchConfig& config,
                SearchResult& out,
                std::string& error,
                const ProgressCallback& progress) {
    if (corpus.empty()) {
        error = "no valid images found";
        return false;
    }
    if (!validate_search_config(config, error)) {
        return false;
    }

    Rng rng(config.seed);
    SearchResult result;
    bool have_best = false;
    size_t done = 0;

    while (done < config.num_trials) {
        const size_t batch_size = std::min(config.trial_batch_size, config.num_trials - done);
        std::vector<Candidate> batch;
        batch.reserve(batch_size);
        for (size_t i = 0; i < batch_size; ++i) {
            batch.push_back(create_random_individual(corpus, config.limits, rng));
        }
        evaluate_range(batch, 0, batch.size(), corpus, config.fitness, config.threads);
        result.evaluations += batch.size();

        // Fold in trial order so the winner does not depend on scheduling.
        bool improved = false;
        for (auto& candidate : batch) {
            if (!candidate.layout) {
                continue;
            }
            LayoutScore score;
            if (!score_layout(*candidate.layout, config.fitness, score)) {
                continue;
            }
            if (!have_best || is_better_trial(score, result.score)) {
                result.best = std::move(candidate);
                result.score = score;
                have_best = true;
                improved = true;
            }
        }
        done += batch_size;

        if (progress) {
            SearchProgress update;
            update.mode = SearchMode::Trials;
            update.step = done;
            update.total = config.num_trials;
            update.has_best = have_best;
            update.improved = improved;
            update.best = result.score;
            progress(update);
        }

        if (have_best && config.stop_free_percent > 0.0 && result.score.free_percent < config.stop_free_percent) {
            break;
        }
    }

    if (!have_best) {
        error = "no suitable layout found";
        return false;
    }
    out = std::move(result);
    return true;
}

bool run_genetic(const ImageCorpus& corpus,
                 const SearchConfig& config,
                 SearchResult& out,
                 std::string& error,
                 const ProgressCallback& progress) {
    if (corpus.empty()) {
        error = "no valid images found";
        return false;
    }
    if (!validate_search_config(config, error)) {
        return false;
    }

    Rng rng(config.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    const size_t population_size = config.population_size;
    size_t evaluations = 0;

    std::vector<Candidate> population;
    population.reserve(population_size);
    for (size_t i = 0; i < population_size; ++i) {
        population.push_back(create_random_individual(corpus, config.limits, rng));
    }
    evaluate_range(population, 0, population.size(), corpus, config.fitness, config.threads);
    evaluations += population.size();
    sort_by_fitness(population);

    auto report = [&](size_t generation, double previous_best) {
        if (!progress) {
            return;
        }
        SearchProgress update;
        update.mode = SearchMode::Genetic;
        update.step = generation;
        update.total = config.generations;
        const Candidate& leader = population.front();
        update.has_best = leader.layout && score_layout(*leader.layout, config.fitness, update.best);
        update.improved = leader.fitness > previous_best;
        progress(update);
    };
    report(0, 0.0);

    const size_t elite_count = std::max<size_t>(1, population_size / 2);
    std::uniform_int_distribution<size_t> pick_elite(0, elite_count - 1);

    for (size_t generation = 1; generation <= config.generations; ++generation) {
        const double previous_best = population.front().fitness;

        std::vector<Candidate> next;
        next.reserve(population_size);
        for (size_t i = 0; i < elite_count; ++i) {
            next.push_back(population[i]);
        }
        while (next.size() < population_size) {
            const Candidate& parent1 = population[pick_elite(rng)];
            const Candidate& parent2 = population[pick_elite(rng)];
            Candidate child;
            if (unit(rng) < config.crossover_rate) {
                child = crossover(parent1, parent2, corpus, config.limits, rng);
            } else {
                child.image_ids = parent1.image_ids;
            }
            if (unit(rng) < config.mutation_rate) {
                mutate(child, corpus, config.limits, rng);
            }
            next.push_back(std::move(child));
        }

        evaluate_range(next, elite_count, next.size(), corpus, config.fitness, config.threads);
        evaluations += next.size() - elite_count;
        sort_by_fitness(next);
        population = std::move(next);
        report(generation, previous_best);
    }

    Candidate& best = population.front();
    SearchResult result;
    if (!best.layout || !score_layout(*best.layout, config.fitness, result.score)) {
        error = "no suitable layout found";
        return false;
    }
    result.best = std::move(best);
    result.evaluations = evaluations;
    out = std::move(result);
    return true;
}

bool run_search(const ImageCorpus& corpus,
                const SearchConfig& config,
                SearchResult& out,
                std::string& error,
                const ProgressCallback& progress) {
    if (config.mode == SearchMode::Trials) {
        return run_trials(corpus, config, out, error, progress);
    }
    return run_genetic(corpus, config, out, error, progress);
}

} // namespace tessera::core
