// AEGIS - Version Comparison Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/controller/version.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace aegis {
namespace controller {

std::vector<uint64_t> ParseVersionFields(const std::string& version) {
    std::vector<uint64_t> fields;
    size_t start = 0;
    while (true) {
        size_t dot = version.find('.', start);
        std::string part = version.substr(start, dot == std::string::npos
                                                     ? std::string::npos
                                                     : dot - start);
        uint64_t value = 0;
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) break;
            uint64_t digit = static_cast<uint64_t>(c - '0');
            // Saturate rather than wrap on absurdly long fields
            if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
                value = std::numeric_limits<uint64_t>::max();
                break;
            }
            value = value * 10 + digit;
        }
        fields.push_back(value);

        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return fields;
}

int CompareVersions(const std::string& a, const std::string& b) {
    std::vector<uint64_t> fa = ParseVersionFields(a);
    std::vector<uint64_t> fb = ParseVersionFields(b);
    size_t n = std::max(fa.size(), fb.size());
    for (size_t i = 0; i < n; ++i) {
        uint64_t x = i < fa.size() ? fa[i] : 0;
        uint64_t y = i < fb.size() ? fb[i] : 0;
        if (x != y) {
            return x < y ? -1 : 1;
        }
    }
    return 0;
}

} // namespace controller
} // namespace aegis
