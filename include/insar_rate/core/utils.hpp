#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace insar_rate::core {

namespace fs = std::filesystem;

constexpr double kDaysPerYear = 365.25;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// Epoch dates are ISO calendar dates (YYYY-MM-DD)
bool is_iso_date(const std::string& date);
long days_since_epoch(const std::string& date);
double years_between(const std::string& first, const std::string& second);

// File utilities
std::vector<fs::path> discover_files(const fs::path& input_dir, const std::string& pattern);
std::vector<fs::path> read_path_list(const fs::path& list_file);
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
std::string file_stem(const fs::path& path);

// Durable replace for files other ranks read after a barrier:
// temp file + fsync + rename + directory fsync
void write_atomically(const fs::path& path, const char* data, size_t size);
void write_atomically(const fs::path& path, const std::string& payload);
// Same sequence for a temp file some other writer has already filled
void commit_file(const fs::path& tmp, const fs::path& path);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// NaN-aware statistics (NaN samples are ignored; empty input yields NaN)
double nan_median(std::vector<double> values);
double nan_mean(const std::vector<double>& values);
double nan_std(const std::vector<double>& values);
size_t count_finite(const Matrix2Df& data);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);
std::string format_double(double value);

// Glob pattern matching
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace insar_rate::core
