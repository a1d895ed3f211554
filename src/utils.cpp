#include <cctype>
#include <filesystem>
#include <fstream>
#include <ranges>
#include <vector>

#include "utils.h"

std::vector<std::string> splitWhitespace(const std::string& str) {
    std::vector<std::string> parts;
    std::string cur;
    for (const char c: str) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) {
                parts.push_back(std::move(cur));
                cur.clear();
            }
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) {
        parts.push_back(std::move(cur));
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (auto&& [i, part]: std::views::enumerate(parts)) {
        if (i > 0) {
            joined += separator;
        }
        joined += part;
    }
    return joined;
}

std::optional<std::string> readFile(const std::filesystem::path& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string text;
    std::string line;
    while (getline(file, line)) {
        text += line + "\n";
    }
    file.close();
    return text;
}
