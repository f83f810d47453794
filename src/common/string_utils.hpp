#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include <QString>
#include <QUrl>

namespace hourglass {

inline std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

inline std::string trim(const std::string &value)
{
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

inline bool containsCaseInsensitive(const std::string &haystack, const std::string &needle)
{
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

inline bool startsWith(const std::string &value, const std::string &prefix)
{
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

inline bool endsWith(const std::string &value, const std::string &suffix)
{
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Non-empty pieces of value between separator characters.
inline std::vector<std::string> splitNonEmpty(const std::string &value, const std::string &separators)
{
    std::vector<std::string> parts;
    std::string current;
    for (const char c : value) {
        if (separators.find(c) != std::string::npos) {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

inline QUrl parseUrl(const std::string &url)
{
    QUrl parsed(QString::fromStdString(url));
    if (parsed.host().isEmpty()) {
        parsed = QUrl::fromUserInput(QString::fromStdString(url));
    }
    return parsed;
}

// Lower-cased host of url, empty when it has none.
inline std::string urlHost(const std::string &url)
{
    return toLower(parseUrl(url).host().toStdString());
}

inline std::string urlPath(const std::string &url)
{
    return parseUrl(url).path().toStdString();
}

} // namespace hourglass
