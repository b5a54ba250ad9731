#include <utils.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace utils
{

std::string to_lower(std::string_view view)
{
    std::string lowered {view};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

std::string_view trim(std::string_view view)
{
    const char* whitespace = " \t\r\n";
    size_t first = view.find_first_not_of(whitespace);
    if(first == std::string_view::npos)
        return {};

    size_t last = view.find_last_not_of(whitespace);
    return view.substr(first, last - first + 1);
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
}

bool starts_with(std::string_view view, std::string_view prefix)
{
    return view.size() >= prefix.size() && view.compare(0, prefix.size(), prefix) == 0;
}

// Length of the well-formed sequence at pos, 0 if it is ill-formed. In that
// case consumed is the length of its longest valid prefix (at least 1).
static size_t utf8_sequence(std::string_view view, size_t pos, size_t& consumed)
{
    uint8_t lead = static_cast<uint8_t>(view[pos]);
    consumed = 1;
    if(lead < 0x80)
        return 1;

    size_t len;
    uint8_t lower = 0x80;
    uint8_t upper = 0xBF;
    if(lead >= 0xC2 && lead <= 0xDF)
    {
        len = 2;
    }
    else if(lead >= 0xE0 && lead <= 0xEF)
    {
        len = 3;
        // Overlong forms and UTF-16 surrogates
        if(lead == 0xE0)
            lower = 0xA0;
        else if(lead == 0xED)
            upper = 0x9F;
    }
    else if(lead >= 0xF0 && lead <= 0xF4)
    {
        len = 4;
        // Overlong forms and values past U+10FFFF
        if(lead == 0xF0)
            lower = 0x90;
        else if(lead == 0xF4)
            upper = 0x8F;
    }
    else
    {
        return 0;
    }

    for(size_t k = 1; k < len; k++)
    {
        if(pos + k >= view.size())
            return 0;

        uint8_t cont = static_cast<uint8_t>(view[pos + k]);
        if(cont < lower || cont > upper)
            return 0;

        lower = 0x80;
        upper = 0xBF;
        consumed++;
    }

    return len;
}

bool is_valid_utf8(std::string_view view)
{
    size_t consumed;
    for(size_t i = 0; i < view.size();)
    {
        size_t len = utf8_sequence(view, i, consumed);
        if(len == 0)
            return false;
        i += len;
    }

    return true;
}

std::string replace_invalid_utf8(std::string_view view)
{
    std::string replaced;
    replaced.reserve(view.size());

    size_t consumed;
    for(size_t i = 0; i < view.size();)
    {
        size_t len = utf8_sequence(view, i, consumed);
        if(len == 0)
        {
            replaced.append(replacement_character);
            i += consumed;
        }
        else
        {
            replaced.append(view.substr(i, len));
            i += len;
        }
    }

    return replaced;
}

std::string_view strip_bom(std::string_view view)
{
    if(starts_with(view, "\xEF\xBB\xBF"))
        view.remove_prefix(3);
    return view;
}

} // utils
