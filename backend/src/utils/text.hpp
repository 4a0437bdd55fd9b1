#pragma once
#include <algorithm>
#include <cctype>
#include <string>

namespace Text
{
    inline std::string trim(const std::string& s)
    {
        std::string t = s;
        while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
        while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
        return t;
    }

    // Trimmed and lower-cased, for matching commands and rating tokens
    inline std::string lowerTrim(const std::string& s)
    {
        std::string t = trim(s);
        std::transform(t.begin(), t.end(), t.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return t;
    }
}
