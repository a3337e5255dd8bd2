#pragma once

#include <string>
#include <vector>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <curl/curl.h>

namespace utils {

inline std::string urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return str;
    }

    char* encoded = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.length()));
    if (!encoded) {
        curl_easy_cleanup(curl);
        return str;
    }
    std::string result(encoded);
    curl_free(encoded);
    curl_easy_cleanup(curl);
    return result;
}

// Wraps a value in single quotes for /bin/sh, escaping embedded quotes
inline std::string shellQuote(const std::string& str) {
    std::string quoted = "'";
    for (char c : str) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

inline std::string trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

inline std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

inline std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

// True for "0", "12", ... ; rejects signs, blanks and anything non-decimal
inline bool isUnsignedInteger(const std::string& str) {
    if (str.empty() || str.size() > 9) {
        return false;
    }
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace utils
