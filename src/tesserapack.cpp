// tesserapack.cpp
// MIT License (c) 2026 Pedro
// Compile: cmake -S . -B build && cmake --build build --target tesserapack

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <fcntl.h>
#include <io.h>
#include <stdio.h>
#endif
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "core/cli_parse.h"
#include "core/compositor.h"
#include "core/image_corpus.h"
#include "core/layout_io.h"
#include "core/worker_pool.h"

namespace fs = std::filesystem;
using namespace tessera::core;

namespace {

void print_usage() {
    std::cout << "Usage: tesserapack [OPTIONS]\n"
              << "\n"
              << "Read collage layout text from stdin and write a PNG to stdout.\n"
              << "\n"
              << "Options:\n"
              << "  --background R,G,B[,A] Canvas background (0-255, default: 255,255,255,255)\n"
              << "  --canvas WxH           Minimum canvas size; the collage is centered\n"
              << "  --root DIR             Resolve relative image paths against DIR\n"
              << "  --threads N            Number of worker threads used to decode images\n"
              << "  --help, -h             Show this help message\n";
}

} // namespace

int main(int argc, char** argv) {
    ComposeOptions options;
    fs::path root;
    unsigned int thread_limit = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--background" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_color(value, options.background)) {
                std::cerr << "Invalid background: " << value << "\n";
                std::cerr << "Expected format: R,G,B or R,G,B,A with 0-255 channels\n";
                return 1;
            }
        } else if (arg == "--canvas" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_resolution(value, options.width, options.height)) {
                std::cerr << "Invalid canvas size: " << value << "\n";
                return 1;
            }
        } else if (arg == "--root" && i + 1 < argc) {
            root = fs::path(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!parse_positive_uint(value, thread_limit)) {
                std::cerr << "Invalid thread count: " << value << "\n";
                return 1;
            }
        } else {
            print_usage();
            return 1;
        }
    }

    LayoutDocument document;
    std::string error;
    if (!parse_layout(std::cin, document, error)) {
        std::cerr << "Invalid layout: " << error << "\n";
        return 1;
    }
    if (document.entries.empty()) {
        std::cerr << "Layout has no images\n";
        return 1;
    }

    // Decode in parallel, one slot per entry, then register in layout order.
    const size_t count = document.entries.size();
    std::vector<Image> decoded(count);
    std::vector<std::string> errors(count);
    std::vector<char> ok(count, 0);
    parallel_for(0, count, thread_limit, [&](size_t idx) {
        fs::path path(document.entries[idx].path);
        if (path.is_relative() && !root.empty()) {
            path = root / path;
        }
        ok[idx] = load_image(path, decoded[idx], errors[idx]) ? 1 : 0;
    });
    for (size_t idx = 0; idx < count; ++idx) {
        if (!ok[idx]) {
            std::cerr << "Failed to load " << document.entries[idx].path << ": " << errors[idx] << "\n";
            return 1;
        }
    }

    ImageCorpus corpus;
    PackedLayout layout;
    layout.canvas_width = document.canvas_width;
    layout.canvas_height = document.canvas_height;
    for (size_t idx = 0; idx < count; ++idx) {
        Image& image = decoded[idx];
        const uint32_t id = corpus.add(std::move(image.path), image.width, image.height, std::move(image.pixels));
        layout.placements.push_back({id, document.entries[idx].rect});
    }

    Canvas canvas;
    if (!compose(corpus, layout, options, canvas, error)) {
        std::cerr << "Failed to compose: " << error << "\n";
        return 1;
    }

#ifdef _WIN32
    _setmode(_fileno(stdout), _O_BINARY);
#endif
    if (!write_canvas_png(canvas, std::cout, error)) {
        std::cerr << "Failed to write PNG: " << error << "\n";
        return 1;
    }
    std::cout.flush();
    return 0;
}
