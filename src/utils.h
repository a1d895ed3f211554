#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Splits on any run of whitespace, dropping empty tokens
std::vector<std::string> splitWhitespace(const std::string& str);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

std::optional<std::string> readFile(const std::filesystem::path& filename);
