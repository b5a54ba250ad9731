#ifndef UPNP_SCOUT_UTILS_HPP
#define UPNP_SCOUT_UTILS_HPP

#include <string>
#include <string_view>

namespace utils
{

std::string to_lower(std::string_view view);

std::string_view trim(std::string_view view);

bool iequals(std::string_view lhs, std::string_view rhs);

bool starts_with(std::string_view view, std::string_view prefix);

// U+FFFD, encoded as UTF-8
inline constexpr std::string_view replacement_character {"\xEF\xBF\xBD"};

// Returns false on overlong encodings, surrogates and truncated sequences
bool is_valid_utf8(std::string_view view);

// Replaces every maximal ill-formed subsequence with U+FFFD
std::string replace_invalid_utf8(std::string_view view);

// Removes a leading UTF-8 byte order mark if there is one
std::string_view strip_bom(std::string_view view);

} // utils

#endif
