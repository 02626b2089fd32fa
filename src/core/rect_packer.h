#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace tessera::core {

struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

struct Placement {
    uint32_t image_id = 0;
    Rect rect;
};

// Placements in packing order. canvas_width/canvas_height are the tight
// bounding box of the placements, not the budget the packer was given.
struct PackedLayout {
    std::vector<Placement> placements;
    int canvas_width = 0;
    int canvas_height = 0;

    bool empty() const { return placements.empty() || canvas_width <= 0 || canvas_height <= 0; }
};

struct PackItem {
    uint32_t image_id = 0;
    int w = 0;
    int h = 0;
};

enum class OverflowPolicy {
    // Single pass; items that do not fit are left out of the layout.
    DropUnfit,
    // Retry with a budget scaled by growth_factor until every item fits or
    // max_attempts is reached; the layout is empty on exhaustion.
    GrowBudget
};

struct PackOptions {
    int padding = 5;
    OverflowPolicy overflow = OverflowPolicy::GrowBudget;
    double growth_factor = 1.2;
    int max_attempts = 5;
    int min_budget_side = 0;
};

// Called after every successful placement with the layout built so far.
// `attempt` counts budget growth rounds from 0.
using PlacementObserver =
    std::function<void(const PackedLayout& partial, const Placement& placed, int attempt)>;

// Bottom-left skyline bin. Each insert reserves (w + padding) x (h + padding)
// at the lowest, then leftmost, position where it fits under the budget.
class SkylinePacker {
public:
    SkylinePacker(int budget_width, int budget_height, int padding);

    bool insert(int w, int h, Rect& out);

private:
    struct Segment {
        int x = 0;
        int y = 0;
        int w = 0;
    };

    bool fits_at(size_t index, int w, int h, int& y) const;
    void add_level(size_t index, int x, int y, int w, int h);
    void merge_levels();

    int budget_width_ = 0;
    int budget_height_ = 0;
    int padding_ = 0;
    std::vector<Segment> skyline_;
};

bool rects_intersect(const Rect& a, const Rect& b);

// One packing pass under a fixed budget. Items that do not fit are skipped.
// Returns true when every item was placed.
bool pack_once(const std::vector<PackItem>& items,
               int budget_width,
               int budget_height,
               int padding,
               PackedLayout& out,
               const PlacementObserver& observer = {},
               int attempt = 0);

// Packs items in the given order; the order is never changed here.
PackedLayout pack(const std::vector<PackItem>& items,
                  int budget_width,
                  int budget_height,
                  const PackOptions& options,
                  const PlacementObserver& observer = {});

// Square-ish budget from the total padded area of the items, shaped to the
// requested aspect ratio and floored at options.min_budget_side.
void estimate_budget(const std::vector<PackItem>& items,
                     const PackOptions& options,
                     double desired_aspect_ratio,
                     int& out_width,
                     int& out_height);

} // namespace tessera::core
