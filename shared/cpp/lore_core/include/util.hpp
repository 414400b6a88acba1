#pragma once
#include <string>
#include <vector>
#include <filesystem>

std::string getenv_or(const char* key, const std::string& def);
std::string read_text_file(const std::filesystem::path& p);
// Writes through a sibling temp file and renames it into place.
void write_text_file_atomic(const std::filesystem::path& p, const std::string& text);
std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const std::vector<std::string>& exts,
                                              const std::vector<std::string>& ignore_dirs);
std::vector<std::string> split_lines(const std::string& text);
std::string join_lines(const std::vector<std::string>& lines, const std::string& sep = "\n");
std::string trim(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
std::string utc_timestamp();
