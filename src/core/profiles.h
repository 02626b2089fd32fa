#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "compositor.h"
#include "image_corpus.h"
#include "search.h"

#ifndef TESSERA_GLOBAL_PROFILE_CONFIG
#define TESSERA_GLOBAL_PROFILE_CONFIG "/usr/local/share/tessera/tesseraprofiles.cfg"
#endif

namespace tessera::core {

constexpr const char* k_profiles_config_filename = "tesseraprofiles.cfg";
constexpr const char* k_user_profiles_config_relpath = ".config/tessera/tesseraprofiles.cfg";
constexpr const char* k_global_profiles_config_path = TESSERA_GLOBAL_PROFILE_CONFIG;

// Values set by a [profile NAME] section. Unset fields keep whatever the
// caller already has.
struct ProfileDefinition {
    std::string name;
    std::optional<SearchMode> mode;
    std::optional<size_t> trials;
    std::optional<size_t> population;
    std::optional<size_t> generations;
    std::optional<size_t> min_images;
    std::optional<size_t> max_images;
    std::optional<double> mutation_rate;
    std::optional<double> crossover_rate;
    std::optional<int> padding;
    std::optional<double> aspect_ratio;
    std::optional<double> aspect_weight;
    std::optional<int> min_canvas;
    std::optional<double> growth_factor;
    std::optional<int> max_attempts;
    std::optional<OverflowPolicy> overflow;
    std::optional<double> stop_free_percent;
    std::optional<unsigned int> threads;
    std::optional<uint64_t> seed;
    std::optional<int> width;
    std::optional<Color> background;
};

bool parse_overflow_policy(const std::string& value, OverflowPolicy& out, std::string& error);

bool parse_profiles_config(std::istream& input, std::vector<ProfileDefinition>& out, std::string& error);
bool load_profiles_config_from_file(const std::filesystem::path& path,
                                    std::vector<ProfileDefinition>& out,
                                    std::string& error);
std::optional<std::filesystem::path> resolve_user_profiles_config_path();

// Candidate config files in lookup order. An explicit path replaces the
// default chain.
std::vector<std::filesystem::path> profile_config_candidates(const std::string& explicit_path,
                                                             const std::filesystem::path& cwd,
                                                             const std::filesystem::path& exec_dir);

const ProfileDefinition* find_profile(const std::vector<ProfileDefinition>& profiles, const std::string& name);

void apply_profile(const ProfileDefinition& profile,
                   SearchConfig& config,
                   LoadOptions& load_options,
                   ComposeOptions& compose_options);

} // namespace tessera::core
