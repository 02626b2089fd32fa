#include "rect_packer.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tessera::core {

namespace {

bool checked_add_int(int a, int b, int& out) {
    if (b > 0 && a > std::numeric_limits<int>::max() - b) {
        return false;
    }
    if (b < 0 && a < std::numeric_limits<int>::min() - b) {
        return false;
    }
    out = a + b;
    return true;
}

int scale_side(int side, double factor) {
    const double scaled = std::floor(static_cast<double>(side) * factor);
    if (scaled >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(scaled);
}

} // namespace

SkylinePacker::SkylinePacker(int budget_width, int budget_height, int padding)
    : budget_width_(std::max(0, budget_width)),
      budget_height_(std::max(0, budget_height)),
      padding_(std::max(0, padding)) {
    skyline_.push_back({0, 0, budget_width_});
}

bool SkylinePacker::fits_at(size_t index, int w, int h, int& y) const {
    const int x = skyline_[index].x;
    if (x > budget_width_ - w) {
        return false;
    }
    int width_left = w;
    y = skyline_[index].y;
    for (size_t i = index; width_left > 0; ++i) {
        if (i >= skyline_.size()) {
            return false;
        }
        y = std::max(y, skyline_[i].y);
        if (y > budget_height_ - h) {
            return false;
        }
        width_left -= skyline_[i].w;
    }
    return true;
}

bool SkylinePacker::insert(int w, int h, Rect& out) {
    int padded_w = 0;
    int padded_h = 0;
    if (w <= 0 || h <= 0 || !checked_add_int(w, padding_, padded_w) || !checked_add_int(h, padding_, padded_h)) {
        return false;
    }
    if (padded_w > budget_width_ || padded_h > budget_height_) {
        return false;
    }

    size_t best_index = skyline_.size();
    int best_y = std::numeric_limits<int>::max();
    int best_x = std::numeric_limits<int>::max();
    for (size_t i = 0; i < skyline_.size(); ++i) {
        int y = 0;
        if (!fits_at(i, padded_w, padded_h, y)) {
            continue;
        }
        if (y < best_y || (y == best_y && skyline_[i].x < best_x)) {
            best_index = i;
            best_y = y;
            best_x = skyline_[i].x;
        }
    }
    if (best_index == skyline_.size()) {
        return false;
    }

    add_level(best_index, best_x, best_y, padded_w, padded_h);
    out = {best_x, best_y, w, h};
    return true;
}

void SkylinePacker::add_level(size_t index, int x, int y, int w, int h) {
    skyline_.insert(skyline_.begin() + static_cast<std::ptrdiff_t>(index), Segment{x, y + h, w});

    for (size_t i = index + 1; i < skyline_.size();) {
        const Segment& prev = skyline_[i - 1];
        const int prev_right = prev.x + prev.w;
        if (skyline_[i].x >= prev_right) {
            break;
        }
        const int shrink = prev_right - skyline_[i].x;
        skyline_[i].x += shrink;
        skyline_[i].w -= shrink;
        if (skyline_[i].w > 0) {
            break;
        }
        skyline_.erase(skyline_.begin() + static_cast<std::ptrdiff_t>(i));
    }
    merge_levels();
}

void SkylinePacker::merge_levels() {
    for (size_t i = 0; i + 1 < skyline_.size();) {
        if (skyline_[i].y == skyline_[i + 1].y) {
            skyline_[i].w += skyline_[i + 1].w;
            skyline_.erase(skyline_.begin() + static_cast<std::ptrdiff_t>(i + 1));
        } else {
            ++i;
        }
    }
}

bool rects_intersect(const Rect& a, const Rect& b) {
    return !(a.x + a.w <= b.x || b.x + b.w <= a.x ||
             a.y + a.h <= b.y || b.y + b.h <= a.y);
}

bool pack_once(const std::vector<PackItem>& items,
               int budget_width,
               int budget_height,
               int padding,
               PackedLayout& out,
               const PlacementObserver& observer,
               int attempt) {
    SkylinePacker packer(budget_width, budget_height, padding);
    PackedLayout layout;
    layout.placements.reserve(items.size());
    bool all_fit = true;

    for (const auto& item : items) {
        Rect rect;
        if (!packer.insert(item.w, item.h, rect)) {
            all_fit = false;
            continue;
        }
        layout.placements.push_back({item.image_id, rect});
        layout.canvas_width = std::max(layout.canvas_width, rect.x + rect.w);
        layout.canvas_height = std::max(layout.canvas_height, rect.y + rect.h);
        if (observer) {
            observer(layout, layout.placements.back(), attempt);
        }
    }

    out = std::move(layout);
    return all_fit;
}

PackedLayout pack(const std::vector<PackItem>& items,
                  int budget_width,
                  int budget_height,
                  const PackOptions& options,
                  const PlacementObserver& observer) {
    if (items.empty()) {
        return {};
    }

    if (options.overflow == OverflowPolicy::DropUnfit) {
        PackedLayout layout;
        pack_once(items, budget_width, budget_height, options.padding, layout, observer, 0);
        return layout;
    }

    const int attempts = std::max(1, options.max_attempts);
    double scale = 1.0;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        const int w = scale_side(budget_width, scale);
        const int h = scale_side(budget_height, scale);
        PackedLayout layout;
        if (pack_once(items, w, h, options.padding, layout, observer, attempt)) {
            return layout;
        }
        scale *= options.growth_factor;
    }
    return {};
}

void estimate_budget(const std::vector<PackItem>& items,
                     const PackOptions& options,
                     double desired_aspect_ratio,
                     int& out_width,
                     int& out_height) {
    out_width = 0;
    out_height = 0;
    if (items.empty() || desired_aspect_ratio <= 0.0) {
        return;
    }

    double total_area = 0.0;
    for (const auto& item : items) {
        const double w = static_cast<double>(item.w) + static_cast<double>(options.padding);
        const double h = static_cast<double>(item.h) + static_cast<double>(options.padding);
        total_area += w * h;
    }

    const double height = std::floor(std::sqrt(total_area / desired_aspect_ratio));
    const double width = std::floor(desired_aspect_ratio * height);
    constexpr double k_int_max = static_cast<double>(std::numeric_limits<int>::max());
    out_width = std::max(options.min_budget_side, static_cast<int>(std::min(width, k_int_max)));
    out_height = std::max(options.min_budget_side, static_cast<int>(std::min(height, k_int_max)));
}

} // namespace tessera::core
