#include "compositor.h"

#include <algorithm>
#include <cstring>
#include <limits>

#include "cli_parse.h"
#include "image_corpus.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace fs = std::filesystem;

namespace tessera::core {

namespace {

constexpr int k_jpeg_quality = 95;

bool checked_mul_size_t(size_t a, size_t b, size_t& out) {
    if (a == 0 || b <= std::numeric_limits<size_t>::max() / a) {
        out = a * b;
        return true;
    }
    return false;
}

bool canvas_is_valid(const Canvas& canvas) {
    return canvas.width > 0 && canvas.height > 0 &&
           canvas.pixels.size() ==
               static_cast<size_t>(canvas.width) * static_cast<size_t>(canvas.height) * NUM_CHANNELS;
}

} // namespace

bool make_canvas(int width, int height, const Color& background, Canvas& out, std::string& error) {
    if (width <= 0 || height <= 0) {
        error = "invalid canvas size " + std::to_string(width) + "x" + std::to_string(height);
        return false;
    }
    size_t pixel_count = 0;
    size_t byte_count = 0;
    if (!checked_mul_size_t(static_cast<size_t>(width), static_cast<size_t>(height), pixel_count)
        || !checked_mul_size_t(pixel_count, NUM_CHANNELS, byte_count)) {
        error = "canvas size is too large";
        return false;
    }

    Canvas canvas;
    canvas.width = width;
    canvas.height = height;
    canvas.pixels.resize(byte_count);
    for (size_t i = 0; i < pixel_count; ++i) {
        std::memcpy(canvas.pixels.data() + i * NUM_CHANNELS, background.data(), NUM_CHANNELS);
    }
    out = std::move(canvas);
    return true;
}

bool blit_image(Canvas& canvas, const Image& image, const Rect& dst, std::string& error) {
    if (!canvas_is_valid(canvas)) {
        error = "invalid canvas";
        return false;
    }
    if (image.width <= 0 || image.height <= 0 ||
        image.pixels.size() != static_cast<size_t>(image.width) * static_cast<size_t>(image.height) * NUM_CHANNELS) {
        error = "invalid image data: " + image.path;
        return false;
    }
    if (dst.x < 0 || dst.y < 0 || dst.w <= 0 || dst.h <= 0 ||
        dst.w > canvas.width || dst.h > canvas.height ||
        dst.x > canvas.width - dst.w || dst.y > canvas.height - dst.h) {
        error = "image out of canvas bounds: " + image.path;
        return false;
    }

    const size_t canvas_stride = static_cast<size_t>(canvas.width) * NUM_CHANNELS;
    const size_t image_stride = static_cast<size_t>(image.width) * NUM_CHANNELS;
    const bool copy_rows_direct = (image.width == dst.w && image.height == dst.h);
    if (copy_rows_direct) {
        const size_t row_bytes = static_cast<size_t>(dst.w) * NUM_CHANNELS;
        for (int row = 0; row < dst.h; ++row) {
            const size_t dest_offset = static_cast<size_t>(dst.y + row) * canvas_stride +
                                       static_cast<size_t>(dst.x) * NUM_CHANNELS;
            const size_t src_offset = static_cast<size_t>(row) * image_stride;
            std::memcpy(canvas.pixels.data() + dest_offset, image.pixels.data() + src_offset, row_bytes);
        }
        return true;
    }

    for (int row = 0; row < dst.h; ++row) {
        const int sample_y = static_cast<int>((static_cast<long long>(row) * image.height) / dst.h);
        for (int col = 0; col < dst.w; ++col) {
            const int sample_x = static_cast<int>((static_cast<long long>(col) * image.width) / dst.w);
            const size_t dest_offset = static_cast<size_t>(dst.y + row) * canvas_stride +
                                       static_cast<size_t>(dst.x + col) * NUM_CHANNELS;
            const size_t src_offset = static_cast<size_t>(sample_y) * image_stride +
                                      static_cast<size_t>(sample_x) * NUM_CHANNELS;
            std::memcpy(canvas.pixels.data() + dest_offset, image.pixels.data() + src_offset, NUM_CHANNELS);
        }
    }
    return true;
}

bool compose(const ImageCorpus& corpus,
             const PackedLayout& layout,
             const ComposeOptions& options,
             Canvas& out,
             std::string& error) {
    if (layout.empty()) {
        error = "layout has no placements";
        return false;
    }

    int min_x = std::numeric_limits<int>::max();
    int min_y = std::numeric_limits<int>::max();
    int max_x = 0;
    int max_y = 0;
    for (const auto& p : layout.placements) {
        min_x = std::min(min_x, p.rect.x);
        min_y = std::min(min_y, p.rect.y);
        max_x = std::max(max_x, p.rect.x + p.rect.w);
        max_y = std::max(max_y, p.rect.y + p.rect.h);
    }
    const int bounding_width = max_x - min_x;
    const int bounding_height = max_y - min_y;

    const int canvas_width = std::max({options.width, layout.canvas_width, bounding_width});
    const int canvas_height = std::max({options.height, layout.canvas_height, bounding_height});
    const int offset_x = std::max(0, (canvas_width - bounding_width) / 2);
    const int offset_y = std::max(0, (canvas_height - bounding_height) / 2);

    Canvas canvas;
    if (!make_canvas(canvas_width, canvas_height, options.background, canvas, error)) {
        return false;
    }

    for (const auto& p : layout.placements) {
        const Image* image = corpus.find(p.image_id);
        if (!image) {
            error = "layout references unknown image id " + std::to_string(p.image_id);
            return false;
        }
        const Rect dst = {offset_x + (p.rect.x - min_x), offset_y + (p.rect.y - min_y), p.rect.w, p.rect.h};
        if (!blit_image(canvas, *image, dst, error)) {
            return false;
        }
    }

    out = std::move(canvas);
    return true;
}

bool write_canvas_png(const Canvas& canvas, std::ostream& out, std::string& error) {
    if (!canvas_is_valid(canvas)) {
        error = "invalid canvas";
        return false;
    }
    auto write_callback = [](void* context, void* data, int size) {
        auto* stream = static_cast<std::ostream*>(context);
        stream->write(static_cast<char*>(data), size);
    };
    if (stbi_write_png_to_func(write_callback, &out, canvas.width, canvas.height, static_cast<int>(NUM_CHANNELS),
                               canvas.pixels.data(), canvas.width * static_cast<int>(NUM_CHANNELS)) == 0) {
        error = "failed to encode PNG";
        return false;
    }
    if (!out) {
        error = "failed to write PNG stream";
        return false;
    }
    return true;
}

bool write_canvas_file(const Canvas& canvas, const fs::path& path, std::string& error) {
    if (!canvas_is_valid(canvas)) {
        error = "invalid canvas";
        return false;
    }
    const std::string ext = to_lower_copy(path.extension().string());
    const std::string file = path.string();
    const int comp = static_cast<int>(NUM_CHANNELS);
    int ok = 0;
    if (ext == ".png") {
        ok = stbi_write_png(file.c_str(), canvas.width, canvas.height, comp, canvas.pixels.data(),
                            canvas.width * comp);
    } else if (ext == ".jpg" || ext == ".jpeg") {
        ok = stbi_write_jpg(file.c_str(), canvas.width, canvas.height, comp, canvas.pixels.data(), k_jpeg_quality);
    } else if (ext == ".bmp") {
        ok = stbi_write_bmp(file.c_str(), canvas.width, canvas.height, comp, canvas.pixels.data());
    } else if (ext == ".tga") {
        ok = stbi_write_tga(file.c_str(), canvas.width, canvas.height, comp, canvas.pixels.data());
    } else {
        error = "unsupported output format '" + ext + "' (use .png, .jpg, .bmp or .tga)";
        return false;
    }
    if (ok == 0) {
        error = "failed to write '" + file + "'";
        return false;
    }
    return true;
}

} // namespace tessera::core
