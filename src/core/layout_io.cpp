#include "layout_io.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <unordered_set>

#include "cli_parse.h"
#include "image_corpus.h"

namespace tessera::core {

bool parse_canvas_line(const std::string& line, int& width, int& height) {
    std::istringstream iss(line);
    std::string tag;
    std::string size_token;
    std::string extra;

    if (!(iss >> tag >> size_token)) {
        return false;
    }
    if (tag != "canvas") {
        return false;
    }
    if (!parse_pair(size_token, width, height)) {
        return false;
    }
    if (iss >> extra) {
        return false;
    }
    return true;
}

bool parse_image_line(const std::string& line, LayoutEntry& out, std::string& error) {
    std::istringstream head(line);
    std::string tag;
    std::string id_token;
    if (!(head >> tag) || tag != "image") {
        error = "line does not start with image";
        return false;
    }
    if (!(head >> id_token)) {
        error = "image line is missing the id";
        return false;
    }
    int id = 0;
    if (!parse_non_negative_int(id_token, id)) {
        error = "invalid image id '" + id_token + "'";
        return false;
    }

    size_t pos = static_cast<size_t>(head.tellg());
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])) != 0) {
        ++pos;
    }
    if (pos >= line.size() || line[pos] != '"') {
        error = "image path must be quoted";
        return false;
    }

    LayoutEntry parsed;
    parsed.image_id = static_cast<uint32_t>(id);
    if (!parse_quoted(line, pos, parsed.path, error)) {
        return false;
    }

    std::vector<std::string> tokens;
    std::istringstream tail(line.substr(pos));
    std::string token;
    while (tail >> token) {
        tokens.push_back(token);
    }
    if (tokens.size() != 2) {
        error = "image line must contain position and size pairs";
        return false;
    }
    if (!parse_pair(tokens[0], parsed.rect.x, parsed.rect.y) || !parse_pair(tokens[1], parsed.rect.w, parsed.rect.h)) {
        error = "invalid position or size pair";
        return false;
    }
    if (parsed.rect.x < 0 || parsed.rect.y < 0 || parsed.rect.w <= 0 || parsed.rect.h <= 0) {
        error = "image geometry must be non-negative with a positive size";
        return false;
    }

    out = std::move(parsed);
    return true;
}

bool parse_layout(std::istream& in, LayoutDocument& out, std::string& error) {
    LayoutDocument parsed;
    bool has_canvas = false;
    std::unordered_set<uint32_t> seen_ids;
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;
        const std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        if (trimmed.starts_with("canvas")) {
            if (has_canvas) {
                error = "duplicate canvas line at line " + std::to_string(line_number);
                return false;
            }
            if (!parse_canvas_line(trimmed, parsed.canvas_width, parsed.canvas_height)) {
                error = "invalid canvas line at line " + std::to_string(line_number) + ": " + trimmed;
                return false;
            }
            has_canvas = true;
        } else if (trimmed.starts_with("image")) {
            LayoutEntry entry;
            std::string entry_error;
            if (!parse_image_line(trimmed, entry, entry_error)) {
                error = "invalid image line at line " + std::to_string(line_number) + ": " + entry_error;
                return false;
            }
            if (!seen_ids.insert(entry.image_id).second) {
                error = "duplicate image id " + std::to_string(entry.image_id) + " at line " +
                        std::to_string(line_number);
                return false;
            }
            parsed.entries.push_back(std::move(entry));
        } else {
            error = "unknown line " + std::to_string(line_number) + ": " + trimmed;
            return false;
        }
    }

    if (!has_canvas || parsed.canvas_width <= 0 || parsed.canvas_height <= 0) {
        error = "invalid canvas size";
        return false;
    }
    for (const auto& entry : parsed.entries) {
        if (entry.rect.x > parsed.canvas_width - entry.rect.w || entry.rect.y > parsed.canvas_height - entry.rect.h) {
            error = "image " + std::to_string(entry.image_id) + " lies outside the canvas";
            return false;
        }
    }

    out = std::move(parsed);
    return true;
}

bool write_layout(std::ostream& out,
                  const PackedLayout& layout,
                  const ImageCorpus& corpus,
                  const LayoutScore* score,
                  std::string& error,
                  const std::filesystem::path& relative_to) {
    if (layout.empty()) {
        error = "layout has no placements";
        return false;
    }

    std::ostringstream text;
    if (score) {
        text << "# fitness " << std::fixed << std::setprecision(6) << score->fitness
             << " free_percent " << std::setprecision(4) << score->free_percent
             << " aspect_diff " << std::setprecision(4) << score->aspect_diff
             << " images " << score->image_count << "\n";
    }
    text << "canvas " << layout.canvas_width << "," << layout.canvas_height << "\n";
    for (const auto& p : layout.placements) {
        const Image* image = corpus.find(p.image_id);
        if (!image) {
            error = "layout references unknown image id " + std::to_string(p.image_id);
            return false;
        }
        std::string path = image->path;
        if (!relative_to.empty()) {
            const std::filesystem::path rel = std::filesystem::path(path).lexically_relative(relative_to);
            if (!rel.empty()) {
                path = rel.generic_string();
            }
        }
        text << "image " << p.image_id << " " << to_quoted(path) << " "
             << p.rect.x << "," << p.rect.y << " " << p.rect.w << "," << p.rect.h << "\n";
    }

    out << text.str();
    if (!out) {
        error = "failed to write layout";
        return false;
    }
    return true;
}

} // namespace tessera::core
