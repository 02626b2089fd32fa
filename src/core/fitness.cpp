#include "fitness.h"

#include <cmath>

#include "image_corpus.h"

namespace tessera::core {

bool score_layout(const PackedLayout& layout, const FitnessParams& params, LayoutScore& out) {
    out = LayoutScore{};
    if (layout.empty()) {
        return false;
    }

    const uint64_t collage_area =
        static_cast<uint64_t>(layout.canvas_width) * static_cast<uint64_t>(layout.canvas_height);
    uint64_t packed_area = 0;
    for (const auto& p : layout.placements) {
        packed_area += static_cast<uint64_t>(p.rect.w) * static_cast<uint64_t>(p.rect.h);
    }
    const uint64_t free_area = collage_area > packed_area ? collage_area - packed_area : 0;
    const double free_percent = 100.0 * static_cast<double>(free_area) / static_cast<double>(collage_area);

    const double aspect = layout.canvas_height == 0
        ? k_zero_height_aspect
        : static_cast<double>(layout.canvas_width) / static_cast<double>(layout.canvas_height);
    const double aspect_diff = std::fabs(aspect - params.desired_aspect_ratio);

    const double image_count = static_cast<double>(layout.placements.size());
    out.fitness = image_count / (1.0 + free_percent + params.aspect_weight * aspect_diff);
    out.free_area = free_area;
    out.free_percent = free_percent;
    out.aspect_diff = aspect_diff;
    out.image_count = layout.placements.size();
    return true;
}

bool build_pack_items(const std::vector<uint32_t>& image_ids,
                      const ImageCorpus& corpus,
                      std::vector<PackItem>& out) {
    out.clear();
    out.reserve(image_ids.size());
    for (uint32_t id : image_ids) {
        const Image* image = corpus.find(id);
        if (!image) {
            return false;
        }
        out.push_back({id, image->width, image->height});
    }
    return true;
}

PackedLayout pack_candidate(const std::vector<uint32_t>& image_ids,
                            const ImageCorpus& corpus,
                            const FitnessParams& params,
                            const PlacementObserver& observer) {
    std::vector<PackItem> items;
    if (image_ids.empty() || !build_pack_items(image_ids, corpus, items)) {
        return {};
    }
    int budget_width = 0;
    int budget_height = 0;
    estimate_budget(items, params.pack, params.desired_aspect_ratio, budget_width, budget_height);
    return pack(items, budget_width, budget_height, params.pack, observer);
}

void evaluate(Candidate& candidate, const ImageCorpus& corpus, const FitnessParams& params) {
    PackedLayout layout = pack_candidate(candidate.image_ids, corpus, params);
    LayoutScore score;
    if (!score_layout(layout, params, score)) {
        candidate.fitness = 0.0;
        candidate.layout.reset();
        return;
    }
    candidate.fitness = score.fitness;
    candidate.layout = std::move(layout);
}

} // namespace tessera::core
