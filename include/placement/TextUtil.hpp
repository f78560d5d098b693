#pragma once
#include <string>
#include <vector>

namespace textutil {

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string s);

// trim + lowercase; used for ids of regions, sectors and categories
std::string normalize_key(const std::string& s);

// lowercase, keep letters/digits/+/#, everything else becomes one space
std::string normalize_tag(const std::string& s);

// case/whitespace-insensitive membership test
bool contains_key(const std::vector<std::string>& keys, const std::string& value);

}
