#include "candidate.h"

#include <algorithm>
#include <unordered_set>

#include "image_corpus.h"

namespace tessera::core {

namespace {

std::vector<uint32_t> unused_ids(const std::vector<uint32_t>& image_ids, const ImageCorpus& corpus) {
    std::unordered_set<uint32_t> used(image_ids.begin(), image_ids.end());
    std::vector<uint32_t> available;
    available.reserve(corpus.size());
    for (const auto& image : corpus.images()) {
        if (used.find(image.id) == used.end()) {
            available.push_back(image.id);
        }
    }
    return available;
}

bool pick_unused_id(const std::vector<uint32_t>& image_ids, const ImageCorpus& corpus, Rng& rng, uint32_t& out) {
    const std::vector<uint32_t> available = unused_ids(image_ids, corpus);
    if (available.empty()) {
        return false;
    }
    std::uniform_int_distribution<size_t> pick(0, available.size() - 1);
    out = available[pick(rng)];
    return true;
}

size_t random_index(size_t size, Rng& rng) {
    std::uniform_int_distribution<size_t> pick(0, size - 1);
    return pick(rng);
}

void clear_evaluation(Candidate& candidate) {
    candidate.fitness = 0.0;
    candidate.layout.reset();
}

} // namespace

Candidate create_random_individual(const ImageCorpus& corpus, const ImageLimits& limits, Rng& rng) {
    const size_t upper = std::max(limits.min_images, limits.max_images);
    std::uniform_int_distribution<size_t> count_dist(limits.min_images, upper);
    const size_t count = std::min(count_dist(rng), corpus.size());

    std::vector<uint32_t> shuffled = corpus.ids();
    std::shuffle(shuffled.begin(), shuffled.end(), rng);
    shuffled.resize(count);

    Candidate candidate;
    candidate.image_ids = std::move(shuffled);
    return candidate;
}

void enforce_image_limits(std::vector<uint32_t>& image_ids,
                          const ImageCorpus& corpus,
                          const ImageLimits& limits,
                          Rng& rng) {
    while (image_ids.size() < limits.min_images) {
        uint32_t id = 0;
        if (!pick_unused_id(image_ids, corpus, rng, id)) {
            break;
        }
        image_ids.push_back(id);
    }

    while (image_ids.size() > limits.max_images) {
        const size_t idx = random_index(image_ids.size(), rng);
        image_ids.erase(image_ids.begin() + static_cast<std::ptrdiff_t>(idx));
    }
}

Candidate crossover(const Candidate& parent1,
                    const Candidate& parent2,
                    const ImageCorpus& corpus,
                    const ImageLimits& limits,
                    Rng& rng) {
    Candidate child;
    const size_t p1_len = parent1.image_ids.size();
    const size_t p2_len = parent2.image_ids.size();
    if (p1_len == 0 && p2_len == 0) {
        return child;
    }

    std::uniform_int_distribution<size_t> cut1_dist(0, p1_len);
    std::uniform_int_distribution<size_t> cut2_dist(0, p2_len);
    const size_t cut1 = cut1_dist(rng);
    const size_t cut2 = cut2_dist(rng);

    child.image_ids.assign(parent1.image_ids.begin(),
                           parent1.image_ids.begin() + static_cast<std::ptrdiff_t>(cut1));
    child.image_ids.insert(child.image_ids.end(),
                           parent2.image_ids.begin() + static_cast<std::ptrdiff_t>(cut2),
                           parent2.image_ids.end());

    std::sort(child.image_ids.begin(), child.image_ids.end());
    child.image_ids.erase(std::unique(child.image_ids.begin(), child.image_ids.end()), child.image_ids.end());

    enforce_image_limits(child.image_ids, corpus, limits, rng);
    return child;
}

void mutate(Candidate& candidate, const ImageCorpus& corpus, const ImageLimits& limits, Rng& rng) {
    clear_evaluation(candidate);
    std::vector<uint32_t>& ids = candidate.image_ids;
    if (ids.empty()) {
        enforce_image_limits(ids, corpus, limits, rng);
        return;
    }

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    const double roll = unit(rng);
    constexpr double k_add_band = 1.0 / 3.0;
    constexpr double k_remove_band = 2.0 / 3.0;

    if (roll < k_add_band && ids.size() < limits.max_images) {
        uint32_t id = 0;
        if (pick_unused_id(ids, corpus, rng, id)) {
            ids.push_back(id);
        }
    } else if (roll < k_remove_band && ids.size() > limits.min_images) {
        const size_t idx = random_index(ids.size(), rng);
        ids.erase(ids.begin() + static_cast<std::ptrdiff_t>(idx));
    } else {
        const size_t idx = random_index(ids.size(), rng);
        uint32_t id = 0;
        if (pick_unused_id(ids, corpus, rng, id)) {
            ids[idx] = id;
        }
    }

    enforce_image_limits(ids, corpus, limits, rng);
}

} // namespace tessera::core
