#pragma once

#include <cstdint>
#include <vector>

#include "candidate.h"
#include "rect_packer.h"

namespace tessera::core {

class ImageCorpus;

constexpr double k_zero_height_aspect = 9999.9;

struct FitnessParams {
    double desired_aspect_ratio = 1.0;
    // Penalty per unit of aspect deviation, relative to one percent of free area.
    double aspect_weight = 10.0;
    PackOptions pack;
};

struct LayoutScore {
    double fitness = 0.0;
    uint64_t free_area = 0;
    double free_percent = 0.0;
    double aspect_diff = 0.0;
    size_t image_count = 0;
};

// fitness = placed / (1 + free_percent + aspect_weight * |w/h - desired|).
// Returns false for an empty layout; `out` then holds the zero score.
bool score_layout(const PackedLayout& layout, const FitnessParams& params, LayoutScore& out);

bool build_pack_items(const std::vector<uint32_t>& image_ids,
                      const ImageCorpus& corpus,
                      std::vector<PackItem>& out);

PackedLayout pack_candidate(const std::vector<uint32_t>& image_ids,
                            const ImageCorpus& corpus,
                            const FitnessParams& params,
                            const PlacementObserver& observer = {});

// Packs and scores the candidate in place. Unpackable candidates get fitness
// 0.0 and no layout.
void evaluate(Candidate& candidate, const ImageCorpus& corpus, const FitnessParams& params);

} // namespace tessera::core
