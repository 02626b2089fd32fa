// tesseralayout.cpp
// MIT License (c) 2026 Pedro
// Compile: cmake -S . -B build && cmake --build build --target tesseralayout

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <system_error>
#include <vector>

#include "core/archive_input.h"
#include "core/cli_parse.h"
#include "core/compositor.h"
#include "core/fitness.h"
#include "core/image_corpus.h"
#include "core/layout_io.h"
#include "core/profiles.h"
#include "core/search.h"

namespace fs = std::filesystem;
using namespace tessera::core;

namespace {

void print_usage() {
    std::cerr << "Usage: tesseralayout <folder|archive.tar|-> [OPTIONS]\n"
              << "\n"
              << "Search for a tight collage layout and print it as text on stdout.\n"
              << "\n"
              << "Options:\n"
              << "  --profile NAME            Load settings from a named profile\n"
              << "  --profiles-config PATH    Profile file to read instead of the default lookup\n"
              << "  --mode trials|genetic     Search strategy (default: genetic)\n"
              << "  --trials N                Monte-Carlo trial count (default: 1000)\n"
              << "  --population N            GA population size (default: 50)\n"
              << "  --generations N           GA generation count (default: 100)\n"
              << "  --min-images N            Fewest images per collage (default: 1)\n"
              << "  --max-images N            Most images per collage, 0 = all (default: 0)\n"
              << "  --mutation-rate F         Mutation probability in [0,1] (default: 0.2)\n"
              << "  --crossover-rate F        Crossover probability in [0,1] (default: 0.7)\n"
              << "  --padding N               Gap between images in pixels (default: 5)\n"
              << "  --aspect-ratio F          Desired width/height ratio (default: 1.0)\n"
              << "  --aspect-weight F         Aspect deviation penalty (default: 10)\n"
              << "  --min-canvas N            Lower bound for the first packing budget side\n"
              << "  --growth-factor F         Budget growth per retry (default: 1.2)\n"
              << "  --max-attempts N          Budget growth retries (default: 5)\n"
              << "  --overflow grow|drop      What to do with images that do not fit (default: grow)\n"
              << "  --stop-free-percent F     Stop trials once free area drops below F percent\n"
              << "  --threads N               Worker threads (default: hardware concurrency)\n"
              << "  --seed N                  Random seed (default: random, printed to stderr)\n"
              << "  --width N                 Scale every image to this width before packing\n"
              << "  --filter PATTERN          Only use files matching an extension or name pattern\n"
              << "  --output PATH             Also render the collage (.png, .jpg, .bmp, .tga)\n"
              << "  --canvas WxH              Minimum output canvas size; the collage is centered\n"
              << "  --background R,G,B[,A]    Canvas background (default: 255,255,255,255)\n"
              << "  --debug-steps DIR         Write one PNG per placement of the winning layout\n"
              << "  --quiet                   Only print errors\n"
              << "  --help, -h                Show this help message\n";
}

void print_progress(const SearchProgress& update) {
    std::cerr << search_mode_name(update.mode) << " " << update.step << "/" << update.total;
    if (update.has_best) {
        std::cerr << " best fitness " << std::fixed << std::setprecision(4) << update.best.fitness
                  << " free " << std::setprecision(2) << update.best.free_percent << "%"
                  << " aspect_diff " << std::setprecision(4) << update.best.aspect_diff
                  << " images " << update.best.image_count;
        if (update.improved) {
            std::cerr << " *";
        }
    } else {
        std::cerr << " no layout yet";
    }
    std::cerr << "\n";
    std::cerr.unsetf(std::ios::floatfield);
}

// Re-packs the winner with an observer and renders every intermediate step.
bool write_debug_steps(const fs::path& dir,
                       const std::vector<uint32_t>& image_ids,
                       const ImageCorpus& corpus,
                       const SearchConfig& config,
                       const ComposeOptions& compose_options,
                       bool quiet,
                       std::string& error) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        error = "failed to create '" + dir.string() + "': " + ec.message();
        return false;
    }

    ComposeOptions step_options;
    step_options.background = compose_options.background;
    size_t step = 0;
    bool failed = false;
    std::string step_error;
    auto observer = [&](const PackedLayout& partial, const Placement& /*placed*/, int attempt) {
        if (failed) {
            return;
        }
        ++step;
        char name[64];
        std::snprintf(name, sizeof(name), "step_%02d_%04zu.png", attempt, step);
        Canvas canvas;
        if (!compose(corpus, partial, step_options, canvas, step_error)
            || !write_canvas_file(canvas, dir / name, step_error)) {
            failed = true;
        }
    };

    const PackedLayout replay = pack_candidate(image_ids, corpus, config.fitness, observer);
    if (failed) {
        error = step_error;
        return false;
    }
    if (replay.empty()) {
        error = "winning candidate did not pack on replay";
        return false;
    }
    if (!quiet) {
        std::cerr << "Wrote " << step << " debug steps to " << dir << "\n";
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string input_arg = argv[1];
    if (input_arg == "--help" || input_arg == "-h") {
        print_usage();
        return 0;
    }

    std::string requested_profile_name;
    std::string profiles_config_path;
    // Command-line values are collected into a profile of their own and
    // applied after the selected profile, so they always win.
    ProfileDefinition overrides;
    overrides.name = "command-line";
    std::optional<std::string> filter;
    std::optional<fs::path> output_path;
    std::optional<fs::path> debug_steps_dir;
    std::optional<std::pair<int, int>> canvas_size;
    bool quiet = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&](std::string& value) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            value = argv[++i];
            return true;
        };
        auto invalid = [&](const std::string& what, const std::string& value) {
            std::cerr << "Invalid " << what << ": " << value << "\n";
            return 1;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--quiet" || arg == "-q") {
            quiet = true;
        } else if (arg == "--profile") {
            if (!next_value(requested_profile_name)) {
                return 1;
            }
        } else if (arg == "--profiles-config") {
            if (!next_value(profiles_config_path)) {
                return 1;
            }
        } else if (arg == "--mode") {
            if (!next_value(value)) {
                return 1;
            }
            SearchMode mode;
            std::string error;
            if (!parse_search_mode(value, mode, error)) {
                return invalid("mode value", value);
            }
            overrides.mode = mode;
        } else if (arg == "--trials" || arg == "--population" || arg == "--generations") {
            if (!next_value(value)) {
                return 1;
            }
            size_t n = 0;
            if (!parse_positive_size(value, n)) {
                return invalid(arg.substr(2), value);
            }
            if (arg == "--trials") {
                overrides.trials = n;
            } else if (arg == "--population") {
                overrides.population = n;
            } else {
                overrides.generations = n;
            }
        } else if (arg == "--min-images" || arg == "--max-images") {
            if (!next_value(value)) {
                return 1;
            }
            size_t n = 0;
            if (!parse_non_negative_size(value, n)) {
                return invalid(arg.substr(2), value);
            }
            if (arg == "--min-images") {
                overrides.min_images = n;
            } else {
                overrides.max_images = n;
            }
        } else if (arg == "--mutation-rate" || arg == "--crossover-rate") {
            if (!next_value(value)) {
                return 1;
            }
            double rate = 0.0;
            if (!parse_rate(value, rate)) {
                return invalid(arg.substr(2), value);
            }
            if (arg == "--mutation-rate") {
                overrides.mutation_rate = rate;
            } else {
                overrides.crossover_rate = rate;
            }
        } else if (arg == "--padding" || arg == "--min-canvas") {
            if (!next_value(value)) {
                return 1;
            }
            int n = 0;
            if (!parse_non_negative_int(value, n)) {
                return invalid(arg.substr(2), value);
            }
            if (arg == "--padding") {
                overrides.padding = n;
            } else {
                overrides.min_canvas = n;
            }
        } else if (arg == "--aspect-ratio") {
            if (!next_value(value)) {
                return 1;
            }
            double ratio = 0.0;
            if (!parse_positive_double(value, ratio)) {
                return invalid("aspect ratio", value);
            }
            overrides.aspect_ratio = ratio;
        } else if (arg == "--aspect-weight") {
            if (!next_value(value)) {
                return 1;
            }
            double weight = 0.0;
            if (!parse_double(value, weight) || weight < 0.0) {
                return invalid("aspect weight", value);
            }
            overrides.aspect_weight = weight;
        } else if (arg == "--growth-factor") {
            if (!next_value(value)) {
                return 1;
            }
            double factor = 0.0;
            if (!parse_double(value, factor) || factor <= 1.0) {
                return invalid("growth factor", value);
            }
            overrides.growth_factor = factor;
        } else if (arg == "--max-attempts") {
            if (!next_value(value)) {
                return 1;
            }
            int attempts = 0;
            if (!parse_positive_int(value, attempts)) {
                return invalid("max attempts", value);
            }
            overrides.max_attempts = attempts;
        } else if (arg == "--overflow") {
            if (!next_value(value)) {
                return 1;
            }
            OverflowPolicy policy;
            std::string error;
            if (!parse_overflow_policy(value, policy, error)) {
                return invalid("overflow policy", value);
            }
            overrides.overflow = policy;
        } else if (arg == "--stop-free-percent") {
            if (!next_value(value)) {
                return 1;
            }
            double percent = 0.0;
            if (!parse_double(value, percent) || percent < 0.0 || percent > 100.0) {
                return invalid("stop free percent", value);
            }
            overrides.stop_free_percent = percent;
        } else if (arg == "--threads") {
            if (!next_value(value)) {
                return 1;
            }
            unsigned int threads = 0;
            if (!parse_positive_uint(value, threads)) {
                return invalid("thread count", value);
            }
            overrides.threads = threads;
        } else if (arg == "--seed") {
            if (!next_value(value)) {
                return 1;
            }
            uint64_t seed = 0;
            if (!parse_uint64(value, seed)) {
                return invalid("seed", value);
            }
            overrides.seed = seed;
        } else if (arg == "--width") {
            if (!next_value(value)) {
                return 1;
            }
            int width = 0;
            if (!parse_positive_int(value, width)) {
                return invalid("width", value);
            }
            overrides.width = width;
        } else if (arg == "--background") {
            if (!next_value(value)) {
                return 1;
            }
            Color color{};
            if (!parse_color(value, color)) {
                std::cerr << "Invalid background: " << value << "\n";
                std::cerr << "Expected format: R,G,B or R,G,B,A with 0-255 channels\n";
                return 1;
            }
            overrides.background = color;
        } else if (arg == "--filter") {
            if (!next_value(value)) {
                return 1;
            }
            filter = value;
        } else if (arg == "--output" || arg == "-o") {
            if (!next_value(value)) {
                return 1;
            }
            output_path = fs::path(value);
        } else if (arg == "--canvas") {
            if (!next_value(value)) {
                return 1;
            }
            int w = 0;
            int h = 0;
            if (!parse_resolution(value, w, h)) {
                return invalid("canvas size", value);
            }
            canvas_size = std::make_pair(w, h);
        } else if (arg == "--debug-steps") {
            if (!next_value(value)) {
                return 1;
            }
            debug_steps_dir = fs::path(value);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    SearchConfig config;
    config.limits = {1, 0};
    LoadOptions load_options;
    ComposeOptions compose_options;
    load_options.filter = filter;
    if (canvas_size) {
        compose_options.width = canvas_size->first;
        compose_options.height = canvas_size->second;
    }

    std::error_code cwd_ec;
    const fs::path cwd = fs::current_path(cwd_ec);
    fs::path exec_path(argv[0]);
    if (exec_path.is_relative() && !cwd.empty()) {
        exec_path = cwd / exec_path;
    }
    const fs::path exec_dir = exec_path.parent_path();
    bool has_seed = false;

    if (!requested_profile_name.empty()) {
        std::vector<ProfileDefinition> profiles;
        std::vector<std::string> tried;
        bool loaded = false;
        for (const fs::path& candidate : profile_config_candidates(profiles_config_path, cwd, exec_dir)) {
            std::error_code ec;
            const bool exists = fs::exists(candidate, ec);
            if (ec || !exists) {
                tried.push_back(candidate.string());
                continue;
            }
            std::string config_error;
            if (!load_profiles_config_from_file(candidate, profiles, config_error)) {
                std::cerr << "Failed to load profile config (" << candidate << "): " << config_error << "\n";
                return 1;
            }
            loaded = true;
            break;
        }
        if (!loaded) {
            std::cerr << "Failed to load profile config. Tried:";
            for (const std::string& candidate : tried) {
                std::cerr << " " << candidate;
            }
            std::cerr << "\n";
            return 1;
        }

        const ProfileDefinition* profile = find_profile(profiles, requested_profile_name);
        if (profile == nullptr) {
            std::string available;
            for (size_t idx = 0; idx < profiles.size(); ++idx) {
                if (idx > 0) {
                    available += ", ";
                }
                available += profiles[idx].name;
            }
            std::cerr << "Invalid profile '" << requested_profile_name << "'. Available profiles: " << available
                      << "\n";
            return 1;
        }
        apply_profile(*profile, config, load_options, compose_options);
        has_seed = profile->seed.has_value();
    } else if (!profiles_config_path.empty()) {
        std::cerr << "--profiles-config requires --profile\n";
        return 1;
    }
    apply_profile(overrides, config, load_options, compose_options);
    has_seed = has_seed || overrides.seed.has_value();

    if (!has_seed) {
        std::random_device device;
        config.seed = (static_cast<uint64_t>(device()) << 32) ^ device();
    }

    InputContext input;
    std::string error;
    if (!open_input(input_arg, input, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    LoadReport report;
    std::vector<fs::path> paths;
    const bool recursive = input.type != InputType::Directory;
    if (!collect_image_paths(input.working_folder, recursive, load_options, paths, report, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    ImageCorpus corpus;
    if (!load_corpus_from_paths(paths, load_options, corpus, report, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    if (!quiet) {
        for (const auto& [path, reason] : report.skipped) {
            std::cerr << "Skipped " << path << ": " << reason << "\n";
        }
        std::cerr << "Loaded " << corpus.size() << " images\n";
    }

    if (config.limits.max_images == 0) {
        config.limits.max_images = corpus.size();
    }
    if (!validate_search_config(config, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    if (!quiet) {
        std::cerr << "Mode " << search_mode_name(config.mode) << ", seed " << config.seed << "\n";
    }

    SearchResult result;
    ProgressCallback progress;
    if (!quiet) {
        progress = print_progress;
    }
    if (!run_search(corpus, config, result, error, progress)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    const PackedLayout& layout = *result.best.layout;

    const fs::path relative_to = input.type == InputType::Directory ? fs::path() : input.working_folder;
    if (!write_layout(std::cout, layout, corpus, &result.score, error, relative_to)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    std::cout.flush();

    if (output_path) {
        Canvas canvas;
        if (!compose(corpus, layout, compose_options, canvas, error)
            || !write_canvas_file(canvas, *output_path, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
        if (!quiet) {
            std::cerr << "Wrote " << canvas.width << "x" << canvas.height << " collage to " << *output_path << "\n";
        }
    }

    if (debug_steps_dir) {
        if (!write_debug_steps(*debug_steps_dir, result.best.image_ids, corpus, config, compose_options, quiet,
                               error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
    }

    return 0;
}
