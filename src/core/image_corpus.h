#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tessera::core {

constexpr size_t NUM_CHANNELS = 4;

// Decoded RGBA8 image. Immutable once it is part of a corpus.
struct Image {
    uint32_t id = 0;
    int width = 0;
    int height = 0;
    std::string path;
    std::vector<unsigned char> pixels;
};

// Images keyed by id. Ids are assigned sequentially from 0 in insertion order,
// so an id doubles as the index into images().
class ImageCorpus {
public:
    uint32_t add(std::string path, int width, int height, std::vector<unsigned char> pixels);

    const Image* find(uint32_t id) const;
    bool contains(uint32_t id) const { return id < images_.size(); }

    const std::vector<Image>& images() const { return images_; }
    std::vector<uint32_t> ids() const;
    size_t size() const { return images_.size(); }
    bool empty() const { return images_.empty(); }

private:
    std::vector<Image> images_;
};

struct LoadOptions {
    std::optional<std::string> filter;
    std::optional<int> standard_width;
};

struct LoadReport {
    std::vector<std::string> loaded;
    std::vector<std::pair<std::string, std::string>> skipped;
};

bool is_supported_image_extension(const std::filesystem::path& path);
bool matches_filter(const std::filesystem::path& path, const std::string& filter);

bool load_image(const std::filesystem::path& path, Image& out, std::string& error);
bool scale_to_width(const Image& in, int width, Image& out, std::string& error);

// Collects the image files of a directory (recursively when `recursive`),
// sorted by path so that id assignment does not depend on listing order.
bool collect_image_paths(const std::filesystem::path& folder,
                         bool recursive,
                         const LoadOptions& options,
                         std::vector<std::filesystem::path>& out,
                         LoadReport& report,
                         std::string& error);

bool load_corpus_from_paths(const std::vector<std::filesystem::path>& paths,
                            const LoadOptions& options,
                            ImageCorpus& out,
                            LoadReport& report,
                            std::string& error);

} // namespace tessera::core
