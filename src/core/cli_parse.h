#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace tessera::core {

bool parse_positive_int(const std::string& value, int& out);
bool parse_non_negative_int(const std::string& value, int& out);
bool parse_non_negative_size(const std::string& value, size_t& out);
bool parse_positive_size(const std::string& value, size_t& out);
bool parse_positive_uint(const std::string& value, unsigned int& out);
bool parse_uint64(const std::string& value, uint64_t& out);

bool parse_int(const std::string& token, int& out);
bool parse_double(const std::string& token, double& out);
bool parse_positive_double(const std::string& token, double& out);
bool parse_rate(const std::string& token, double& out);
bool parse_pair(const std::string& token, int& a, int& b);
bool parse_resolution(const std::string& value, int& out_width, int& out_height);
bool parse_color(const std::string& value, std::array<unsigned char, 4>& out);

bool parse_quoted(std::string_view input, size_t& pos, std::string& out, std::string& error);

std::string to_quoted(const std::string& s);
std::string to_lower_copy(std::string value);
std::string trim_copy(const std::string& s);

} // namespace tessera::core
