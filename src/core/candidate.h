#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "rect_packer.h"

namespace tessera::core {

class ImageCorpus;

using Rng = std::mt19937_64;

// One collage proposal: which images to pack, in which order. fitness stays
// 0.0 and layout empty until the candidate has been evaluated.
struct Candidate {
    std::vector<uint32_t> image_ids;
    double fitness = 0.0;
    std::optional<PackedLayout> layout;
};

struct ImageLimits {
    size_t min_images = 0;
    size_t max_images = 0;
};

// Uniform size in [min_images, max_images] clamped to the corpus, then a
// uniform subset of that size (shuffle then truncate).
Candidate create_random_individual(const ImageCorpus& corpus, const ImageLimits& limits, Rng& rng);

// Tops up with random unused ids while below min_images (stopping when the
// corpus runs out), then drops random ids while above max_images.
void enforce_image_limits(std::vector<uint32_t>& image_ids,
                          const ImageCorpus& corpus,
                          const ImageLimits& limits,
                          Rng& rng);

Candidate crossover(const Candidate& parent1,
                    const Candidate& parent2,
                    const ImageCorpus& corpus,
                    const ImageLimits& limits,
                    Rng& rng);

void mutate(Candidate& candidate, const ImageCorpus& corpus, const ImageLimits& limits, Rng& rng);

} // namespace tessera::core
