#include "image_corpus.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <limits>
#include <system_error>

#include "cli_parse.h"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace fs = std::filesystem;

namespace tessera::core {

namespace {

constexpr int k_max_image_dimension = 32768;
constexpr size_t k_max_extension_filter_length = 5;

bool checked_mul_size_t(size_t a, size_t b, size_t& out) {
    if (a == 0 || b <= std::numeric_limits<size_t>::max() / a) {
        out = a * b;
        return true;
    }
    return false;
}

bool looks_like_extension(const std::string& filter) {
    if (filter.empty() || filter.size() > k_max_extension_filter_length) {
        return false;
    }
    return std::all_of(filter.begin(), filter.end(),
                       [](unsigned char c) { return std::isalnum(c) != 0; });
}

} // namespace

uint32_t ImageCorpus::add(std::string path, int width, int height, std::vector<unsigned char> pixels) {
    Image image;
    image.id = static_cast<uint32_t>(images_.size());
    image.width = width;
    image.height = height;
    image.path = std::move(path);
    image.pixels = std::move(pixels);
    images_.push_back(std::move(image));
    return images_.back().id;
}

const Image* ImageCorpus::find(uint32_t id) const {
    if (!contains(id)) {
        return nullptr;
    }
    return &images_[id];
}

std::vector<uint32_t> ImageCorpus::ids() const {
    std::vector<uint32_t> out;
    out.reserve(images_.size());
    for (const auto& image : images_) {
        out.push_back(image.id);
    }
    return out;
}

bool is_supported_image_extension(const fs::path& path) {
    std::string ext = to_lower_copy(path.extension().string());
    if (ext.empty() || ext.size() > 10) {
        return false;
    }
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" ||
           ext == ".tga" || ext == ".gif" || ext == ".psd" || ext == ".pic" ||
           ext == ".pnm" || ext == ".pgm" || ext == ".ppm" || ext == ".hdr";
}

bool matches_filter(const fs::path& path, const std::string& filter) {
    if (filter.empty()) {
        return true;
    }
    const std::string name = path.filename().string();
    const std::string ext = path.extension().string();

    if (filter.front() == '.') {
        return to_lower_copy(ext) == to_lower_copy(filter);
    }
    if (looks_like_extension(filter) && !ext.empty() &&
        to_lower_copy(ext.substr(1)) == to_lower_copy(filter)) {
        return true;
    }

    std::string needle;
    needle.reserve(filter.size());
    for (char c : filter) {
        if (c != '*') {
            needle.push_back(c);
        }
    }
    if (needle.empty()) {
        return true;
    }
    return name.find(needle) != std::string::npos;
}

bool load_image(const fs::path& path, Image& out, std::string& error) {
    int w = 0;
    int h = 0;
    int channels = 0;
    unsigned char* data = stbi_load(path.string().c_str(), &w, &h, &channels, static_cast<int>(NUM_CHANNELS));
    if (!data) {
        const char* reason = stbi_failure_reason();
        error = "failed to decode '" + path.string() + "'" + (reason ? std::string(": ") + reason : std::string());
        return false;
    }
    if (w <= 0 || h <= 0 || w > k_max_image_dimension || h > k_max_image_dimension) {
        stbi_image_free(data);
        error = "unsupported image dimensions in '" + path.string() + "'";
        return false;
    }

    size_t pixel_count = 0;
    size_t byte_count = 0;
    if (!checked_mul_size_t(static_cast<size_t>(w), static_cast<size_t>(h), pixel_count)
        || !checked_mul_size_t(pixel_count, NUM_CHANNELS, byte_count)) {
        stbi_image_free(data);
        error = "image is too large: '" + path.string() + "'";
        return false;
    }

    Image loaded;
    loaded.width = w;
    loaded.height = h;
    loaded.path = path.string();
    loaded.pixels.assign(data, data + byte_count);
    stbi_image_free(data);
    out = std::move(loaded);
    return true;
}

bool scale_to_width(const Image& in, int width, Image& out, std::string& error) {
    if (width <= 0 || width > k_max_image_dimension) {
        error = "invalid standard width " + std::to_string(width);
        return false;
    }
    if (in.width <= 0 || in.height <= 0 ||
        in.pixels.size() != static_cast<size_t>(in.width) * static_cast<size_t>(in.height) * NUM_CHANNELS) {
        error = "invalid source image '" + in.path + "'";
        return false;
    }

    const double ratio = static_cast<double>(width) / static_cast<double>(in.width);
    int height = static_cast<int>(std::floor(ratio * static_cast<double>(in.height)));
    if (height < 1) {
        height = 1;
    }
    if (height > k_max_image_dimension) {
        error = "scaled height is too large for '" + in.path + "'";
        return false;
    }

    Image scaled;
    scaled.id = in.id;
    scaled.path = in.path;
    scaled.width = width;
    scaled.height = height;
    if (width == in.width && height == in.height) {
        scaled.pixels = in.pixels;
        out = std::move(scaled);
        return true;
    }
    scaled.pixels.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * NUM_CHANNELS);

    // Bilinear sampling at pixel centers.
    const double sx = static_cast<double>(in.width) / static_cast<double>(width);
    const double sy = static_cast<double>(in.height) / static_cast<double>(height);
    auto texel = [&](int x, int y, size_t channel) -> double {
        const size_t idx = (static_cast<size_t>(y) * static_cast<size_t>(in.width) + static_cast<size_t>(x)) * NUM_CHANNELS;
        return static_cast<double>(in.pixels[idx + channel]);
    };

    for (int row = 0; row < height; ++row) {
        double fy = (static_cast<double>(row) + 0.5) * sy - 0.5;
        fy = std::clamp(fy, 0.0, static_cast<double>(in.height - 1));
        const int y0 = static_cast<int>(fy);
        const int y1 = std::min(y0 + 1, in.height - 1);
        const double ty = fy - static_cast<double>(y0);
        for (int col = 0; col < width; ++col) {
            double fx = (static_cast<double>(col) + 0.5) * sx - 0.5;
            fx = std::clamp(fx, 0.0, static_cast<double>(in.width - 1));
            const int x0 = static_cast<int>(fx);
            const int x1 = std::min(x0 + 1, in.width - 1);
            const double tx = fx - static_cast<double>(x0);
            const size_t dest = (static_cast<size_t>(row) * static_cast<size_t>(width) + static_cast<size_t>(col)) * NUM_CHANNELS;
            for (size_t c = 0; c < NUM_CHANNELS; ++c) {
                const double top = texel(x0, y0, c) * (1.0 - tx) + texel(x1, y0, c) * tx;
                const double bottom = texel(x0, y1, c) * (1.0 - tx) + texel(x1, y1, c) * tx;
                const double value = top * (1.0 - ty) + bottom * ty;
                scaled.pixels[dest + c] = static_cast<unsigned char>(std::clamp(std::lround(value), 0L, 255L));
            }
        }
    }

    out = std::move(scaled);
    return true;
}

bool collect_image_paths(const fs::path& folder,
                         bool recursive,
                         const LoadOptions& options,
                         std::vector<fs::path>& out,
                         LoadReport& report,
                         std::string& error) {
    std::error_code ec;
    if (!fs::is_directory(folder, ec) || ec) {
        error = "not a directory: '" + folder.string() + "'";
        return false;
    }

    std::vector<fs::path> found;
    auto consider = [&](const fs::directory_entry& entry) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry_ec) {
            return;
        }
        const fs::path& path = entry.path();
        if (options.filter && !matches_filter(path, *options.filter)) {
            report.skipped.emplace_back(path.string(), "does not match filter");
            return;
        }
        if (!is_supported_image_extension(path)) {
            report.skipped.emplace_back(path.string(), "unsupported extension");
            return;
        }
        found.push_back(path);
    };

    if (recursive) {
        fs::recursive_directory_iterator it(folder, ec);
        if (ec) {
            error = "failed to list '" + folder.string() + "': " + ec.message();
            return false;
        }
        for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                error = "failed to list '" + folder.string() + "': " + ec.message();
                return false;
            }
            consider(*it);
        }
    } else {
        fs::directory_iterator it(folder, ec);
        if (ec) {
            error = "failed to list '" + folder.string() + "': " + ec.message();
            return false;
        }
        for (const fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                error = "failed to list '" + folder.string() + "': " + ec.message();
                return false;
            }
            consider(*it);
        }
    }

    std::sort(found.begin(), found.end());
    out = std::move(found);
    return true;
}

bool load_corpus_from_paths(const std::vector<fs::path>& paths,
                            const LoadOptions& options,
                            ImageCorpus& out,
                            LoadReport& report,
                            std::string& error) {
    ImageCorpus corpus;
    for (const auto& path : paths) {
        Image decoded;
        std::string image_error;
        if (!load_image(path, decoded, image_error)) {
            report.skipped.emplace_back(path.string(), image_error);
            continue;
        }
        if (options.standard_width) {
            Image scaled;
            if (!scale_to_width(decoded, *options.standard_width, scaled, image_error)) {
                report.skipped.emplace_back(path.string(), image_error);
                continue;
            }
            decoded = std::move(scaled);
        }
        corpus.add(std::move(decoded.path), decoded.width, decoded.height, std::move(decoded.pixels));
        report.loaded.push_back(path.string());
    }

    if (corpus.empty()) {
        error = "no valid images found";
        return false;
    }
    out = std::move(corpus);
    return true;
}

} // namespace tessera::core
