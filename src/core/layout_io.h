#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "fitness.h"
#include "rect_packer.h"

namespace tessera::core {

class ImageCorpus;

struct LayoutEntry {
    uint32_t image_id = 0;
    std::string path;
    Rect rect;
};

// Text form of a packed layout:
//   canvas W,H
//   image ID "PATH" X,Y W,H
// Lines starting with '#' are comments.
struct LayoutDocument {
    int canvas_width = 0;
    int canvas_height = 0;
    std::vector<LayoutEntry> entries;
};

bool parse_canvas_line(const std::string& line, int& width, int& height);
bool parse_image_line(const std::string& line, LayoutEntry& out, std::string& error);
bool parse_layout(std::istream& in, LayoutDocument& out, std::string& error);

// Paths are written relative to `relative_to` when it is set (archive inputs
// are extracted to a temporary folder that does not outlive the run).
bool write_layout(std::ostream& out,
                  const PackedLayout& layout,
                  const ImageCorpus& corpus,
                  const LayoutScore* score,
                  std::string& error,
                  const std::filesystem::path& relative_to = {});

} // namespace tessera::core
