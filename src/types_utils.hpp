#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace mdns_client
{

// "printer1.local." -> "printer1.local"
inline std::string_view NormalizeName(std::string_view name)
{
    if (!name.empty() && name.back() == '.') {
        name.remove_suffix(1);
    }
    return name;
}

inline char AsciiToLower(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

inline std::string ToLowerAscii(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), AsciiToLower);
    return lower;
}

// DNS names compare case insensitively, trailing dot ignored
inline bool NamesEqual(std::string_view lhs, std::string_view rhs)
{
    lhs = NormalizeName(lhs);
    rhs = NormalizeName(rhs);
    return lhs.size() == rhs.size()
        && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return AsciiToLower(a) == AsciiToLower(b);
           });
}

inline bool NameContains(std::string_view name, std::string_view part)
{
    name = NormalizeName(name);
    part = NormalizeName(part);
    const auto it = std::search(name.begin(), name.end(), part.begin(), part.end(), [](char a, char b) {
        return AsciiToLower(a) == AsciiToLower(b);
    });
    return it != name.end() || part.empty();
}

}
