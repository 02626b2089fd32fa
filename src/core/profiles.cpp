#include "profiles.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>

#include "cli_parse.h"

namespace fs = std::filesystem;

namespace tessera::core {
namespace {

std::string at_line(size_t line_number) {
    return " at line " + std::to_string(line_number);
}

// Assigns one key of the current profile. Returns false with `error` set on an
// unknown key or a malformed value.
bool assign_profile_key(ProfileDefinition& def,
                        const std::string& key,
                        const std::string& value,
                        std::string& error) {
    const std::string lower_key = to_lower_copy(key);
    auto invalid = [&]() {
        error = "invalid " + lower_key + " '" + value + "'";
        return false;
    };

    if (lower_key == "mode") {
        SearchMode mode;
        if (!parse_search_mode(value, mode, error)) {
            return false;
        }
        def.mode = mode;
    } else if (lower_key == "trials") {
        size_t n = 0;
        if (!parse_positive_size(value, n)) {
            return invalid();
        }
        def.trials = n;
    } else if (lower_key == "population") {
        size_t n = 0;
        if (!parse_positive_size(value, n)) {
            return invalid();
        }
        def.population = n;
    } else if (lower_key == "generations") {
        size_t n = 0;
        if (!parse_positive_size(value, n)) {
            return invalid();
        }
        def.generations = n;
    } else if (lower_key == "min_images") {
        size_t n = 0;
        if (!parse_non_negative_size(value, n)) {
            return invalid();
        }
        def.min_images = n;
    } else if (lower_key == "max_images") {
        size_t n = 0;
        if (!parse_non_negative_size(value, n)) {
            return invalid();
        }
        def.max_images = n;
    } else if (lower_key == "mutation_rate") {
        double rate = 0.0;
        if (!parse_rate(value, rate)) {
            return invalid();
        }
        def.mutation_rate = rate;
    } else if (lower_key == "crossover_rate") {
        double rate = 0.0;
        if (!parse_rate(value, rate)) {
            return invalid();
        }
        def.crossover_rate = rate;
    } else if (lower_key == "padding") {
        int padding = 0;
        if (!parse_non_negative_int(value, padding)) {
            return invalid();
        }
        def.padding = padding;
    } else if (lower_key == "aspect_ratio") {
        double ratio = 0.0;
        if (!parse_positive_double(value, ratio)) {
            return invalid();
        }
        def.aspect_ratio = ratio;
    } else if (lower_key == "aspect_weight") {
        double weight = 0.0;
        if (!parse_double(value, weight) || weight < 0.0) {
            return invalid();
        }
        def.aspect_weight = weight;
    } else if (lower_key == "min_canvas") {
        int side = 0;
        if (!parse_non_negative_int(value, side)) {
            return invalid();
        }
        def.min_canvas = side;
    } else if (lower_key == "growth_factor") {
        double factor = 0.0;
        if (!parse_double(value, factor) || factor <= 1.0) {
            return invalid();
        }
        def.growth_factor = factor;
    } else if (lower_key == "max_attempts") {
        int attempts = 0;
        if (!parse_positive_int(value, attempts)) {
            return invalid();
        }
        def.max_attempts = attempts;
    } else if (lower_key == "overflow") {
        OverflowPolicy policy;
        if (!parse_overflow_policy(value, policy, error)) {
            return false;
        }
        def.overflow = policy;
    } else if (lower_key == "stop_free_percent") {
        double percent = 0.0;
        if (!parse_double(value, percent) || percent < 0.0 || percent > 100.0) {
            return invalid();
        }
        def.stop_free_percent = percent;
    } else if (lower_key == "threads") {
        unsigned int threads = 0;
        if (!parse_positive_uint(value, threads)) {
            return invalid();
        }
        def.threads = threads;
    } else if (lower_key == "seed") {
        uint64_t seed = 0;
        if (!parse_uint64(value, seed)) {
            return invalid();
        }
        def.seed = seed;
    } else if (lower_key == "width") {
        int width = 0;
        if (!parse_positive_int(value, width)) {
            return invalid();
        }
        def.width = width;
    } else if (lower_key == "background") {
        Color color{};
        if (!parse_color(value, color)) {
            return invalid();
        }
        def.background = color;
    } else {
        error = "unknown key '" + key + "'";
        return false;
    }
    return true;
}

} // namespace

bool parse_overflow_policy(const std::string& value, OverflowPolicy& out, std::string& error) {
    const std::string lower = to_lower_copy(trim_copy(value));
    if (lower == "grow") {
        out = OverflowPolicy::GrowBudget;
        return true;
    }
    if (lower == "drop") {
        out = OverflowPolicy::DropUnfit;
        return true;
    }
    error = "invalid overflow policy '" + value + "' (expected grow or drop)";
    return false;
}

bool parse_profiles_config(std::istream& input, std::vector<ProfileDefinition>& out, std::string& error) {
    out.clear();
    std::unordered_set<std::string> seen_names;
    std::unordered_set<std::string> seen_keys;
    std::optional<ProfileDefinition> current;
    std::string line;
    size_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        const std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            if (current) {
                out.push_back(std::move(*current));
                current.reset();
            }
            std::istringstream iss(trimmed.substr(1, trimmed.size() - 2));
            std::string section_type;
            if (!(iss >> section_type)) {
                error = "empty section header" + at_line(line_number);
                return false;
            }
            section_type = to_lower_copy(section_type);
            if (section_type != "profile") {
                error = "unsupported section '" + section_type + "'" + at_line(line_number);
                return false;
            }
            std::string name;
            if (!(iss >> name)) {
                error = "missing profile name" + at_line(line_number);
                return false;
            }
            std::string extra;
            if (iss >> extra) {
                error = "unexpected token '" + extra + "' in profile header" + at_line(line_number);
                return false;
            }
            if (!seen_names.insert(name).second) {
                error = "duplicate profile '" + name + "'" + at_line(line_number);
                return false;
            }
            current = ProfileDefinition{};
            current->name = name;
            seen_keys.clear();
            continue;
        }

        if (!current) {
            error = "entry outside of profile section" + at_line(line_number);
            return false;
        }

        const size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            error = "invalid line '" + trimmed + "'" + at_line(line_number);
            return false;
        }
        const std::string key = trim_copy(trimmed.substr(0, equals));
        const std::string value = trim_copy(trimmed.substr(equals + 1));
        if (key.empty()) {
            error = "empty key" + at_line(line_number);
            return false;
        }
        if (value.empty()) {
            error = "empty value for key '" + key + "'" + at_line(line_number);
            return false;
        }
        if (!seen_keys.insert(to_lower_copy(key)).second) {
            error = "duplicate key '" + key + "'" + at_line(line_number);
            return false;
        }
        if (!assign_profile_key(*current, key, value, error)) {
            error += at_line(line_number);
            return false;
        }
    }

    if (current) {
        out.push_back(std::move(*current));
    }
    if (out.empty()) {
        error = "no profiles defined";
        return false;
    }
    return true;
}

bool load_profiles_config_from_file(const fs::path& path,
                                    std::vector<ProfileDefinition>& out,
                                    std::string& error) {
    std::ifstream input(path);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    return parse_profiles_config(input, out, error);
}

std::optional<fs::path> resolve_user_profiles_config_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return fs::path(home) / k_user_profiles_config_relpath;
}

std::vector<fs::path> profile_config_candidates(const std::string& explicit_path,
                                                const fs::path& cwd,
                                                const fs::path& exec_dir) {
    std::vector<fs::path> candidates;
    if (!explicit_path.empty()) {
        fs::path candidate(explicit_path);
        if (candidate.is_relative() && !cwd.empty()) {
            candidate = cwd / candidate;
        }
        candidates.push_back(std::move(candidate));
        return candidates;
    }
    if (std::optional<fs::path> user_config = resolve_user_profiles_config_path()) {
        candidates.push_back(*user_config);
    }
    if (!exec_dir.empty()) {
        candidates.push_back(exec_dir / k_profiles_config_filename);
    }
    candidates.push_back(fs::path(k_global_profiles_config_path));
    return candidates;
}

const ProfileDefinition* find_profile(const std::vector<ProfileDefinition>& profiles, const std::string& name) {
    for (const auto& def : profiles) {
        if (def.name == name) {
            return &def;
        }
    }
    return nullptr;
}

void apply_profile(const ProfileDefinition& profile,
                   SearchConfig& config,
                   LoadOptions& load_options,
                   ComposeOptions& compose_options) {
    if (profile.mode) {
        config.mode = *profile.mode;
    }
    if (profile.trials) {
        config.num_trials = *profile.trials;
    }
    if (profile.population) {
        config.population_size = *profile.population;
    }
    if (profile.generations) {
        config.generations = *profile.generations;
    }
    if (profile.min_images) {
        config.limits.min_images = *profile.min_images;
    }
    if (profile.max_images) {
        config.limits.max_images = *profile.max_images;
    }
    if (profile.mutation_rate) {
        config.mutation_rate = *profile.mutation_rate;
    }
    if (profile.crossover_rate) {
        config.crossover_rate = *profile.crossover_rate;
    }
    if (profile.padding) {
        config.fitness.pack.padding = *profile.padding;
    }
    if (profile.aspect_ratio) {
        config.fitness.desired_aspect_ratio = *profile.aspect_ratio;
    }
    if (profile.aspect_weight) {
        config.fitness.aspect_weight = *profile.aspect_weight;
    }
    if (profile.min_canvas) {
        config.fitness.pack.min_budget_side = *profile.min_canvas;
    }
    if (profile.growth_factor) {
        config.fitness.pack.growth_factor = *profile.growth_factor;
    }
    if (profile.max_attempts) {
        config.fitness.pack.max_attempts = *profile.max_attempts;
    }
    if (profile.overflow) {
        config.fitness.pack.overflow = *profile.overflow;
    }
    if (profile.stop_free_percent) {
        config.stop_free_percent = *profile.stop_free_percent;
    }
    if (profile.threads) {
        config.threads = *profile.threads;
    }
    if (profile.seed) {
        config.seed = *profile.seed;
    }
    if (profile.width) {
        load_options.standard_width = *profile.width;
    }
    if (profile.background) {
        compose_options.background = *profile.background;
    }
}

} // namespace tessera::core
