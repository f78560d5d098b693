#include "placement/TextUtil.hpp"

#include <cctype>

namespace textutil {

std::string trim_copy(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string normalize_key(const std::string& s) {
    return to_lower_copy(trim_copy(s));
}

std::string normalize_tag(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char ch : s) {
        unsigned char c = static_cast<unsigned char>(std::tolower(ch));

        bool keep =
            (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            (c == '+') || (c == '#'); // keeps "c++" and "c#"

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        } else if (!prev_space) {
            out.push_back(' ');
            prev_space = true;
        }
    }

    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

bool contains_key(const std::vector<std::string>& keys, const std::string& value) {
    const std::string v = normalize_key(value);
    for (const auto& k : keys) {
        if (normalize_key(k) == v) return true;
    }
    return false;
}

}
