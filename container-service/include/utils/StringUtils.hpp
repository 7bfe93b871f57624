#pragma once

#include <string>
#include <vector>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace containers::utils {

/**
 * @brief Обрезать пробелы по краям
 */
inline std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

/**
 * @brief Разбить список через запятую ("a, b,,c" -> {"a","b","c"})
 */
inline std::vector<std::string> splitList(const std::string& s, char delimiter = ',') {
    std::vector<std::string> result;
    std::istringstream stream(s);
    std::string item;
    while (std::getline(stream, item, delimiter)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

/**
 * @brief Разбить путь на сегменты без query string ("/a/b?x=1" -> {"a","b"})
 */
inline std::vector<std::string> pathSegments(const std::string& fullPath) {
    std::string path = fullPath.substr(0, fullPath.find('?'));
    std::vector<std::string> segments;
    std::istringstream stream(path);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    return segments;
}

/**
 * @brief Сопоставление с шаблоном, где '*' означает любую подстроку
 */
inline bool wildcardMatch(const std::string& pattern, const std::string& value) {
    size_t p = 0, v = 0;
    size_t star = std::string::npos, mark = 0;
    while (v < value.size()) {
        if (p < pattern.size() && pattern[p] == value[v]) {
            ++p;
            ++v;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = v;
        } else if (star != std::string::npos) {
            p = star + 1;
            v = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

/**
 * @brief Percent-encoding для query параметров URL
 *
 * RFC 3986 unreserved и '/' остаются как есть.
 */
inline std::string urlEncode(const std::string& value) {
    std::ostringstream ss;
    ss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            ss << c;
        } else {
            ss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return ss.str();
}

/**
 * @brief Разбор булевого флага из query/body ("1", "true", "True")
 */
inline bool parseFlag(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes";
}

} // namespace containers::utils
