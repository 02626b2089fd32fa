#pragma once

#include <array>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "rect_packer.h"

namespace tessera::core {

class ImageCorpus;
struct Image;

using Color = std::array<unsigned char, 4>;

constexpr Color k_default_background = {255, 255, 255, 255};

// RGBA8, row-major, no padding between rows.
struct Canvas {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> pixels;
};

struct ComposeOptions {
    // 0 keeps the layout's own size; smaller values are raised to it.
    int width = 0;
    int height = 0;
    Color background = k_default_background;
};

bool make_canvas(int width, int height, const Color& background, Canvas& out, std::string& error);

// Copies `image` into the dst rectangle, nearest-neighbour resampling when the
// sizes differ.
bool blit_image(Canvas& canvas, const Image& image, const Rect& dst, std::string& error);

// Renders the layout with the packed cluster centered on the canvas.
bool compose(const ImageCorpus& corpus,
             const PackedLayout& layout,
             const ComposeOptions& options,
             Canvas& out,
             std::string& error);

bool write_canvas_png(const Canvas& canvas, std::ostream& out, std::string& error);
// Format chosen from the extension: .png, .jpg/.jpeg, .bmp, .tga.
bool write_canvas_file(const Canvas& canvas, const std::filesystem::path& path, std::string& error);

} // namespace tessera::core
