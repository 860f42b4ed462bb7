// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cctype>
#include <string>
#include <vector>

#include <utils/string.hh>

namespace vellum {
namespace {

inline bool
is_space(char c)
{
    return std::isspace(static_cast< unsigned char >(c));
}

} // anonymous

std::vector< std::string >
tokenize(const std::string &s)
{
    std::vector< std::string > xs;

    auto iter = s.begin(), last = s.end();

    while (iter != last) {
        for (; iter != last && is_space(*iter); ++iter) ;

        if (iter == last)
            break;

        auto first = iter;

        if (*iter == '"' || *iter == '\'') {
            const char quote = *iter;

            for (++iter; iter != last && *iter != quote; ++iter) ;

            xs.emplace_back(first + 1, iter);

            if (iter != last)
                ++iter;
        }
        else {
            for (; iter != last && !is_space(*iter); ++iter) ;
            xs.emplace_back(first, iter);
        }
    }

    return xs;
}

std::u32string
utf8_decode(const std::string &s)
{
    static constexpr char32_t replacement = 0xFFFD;

    std::u32string xs;
    xs.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        const auto c = static_cast< unsigned char >(s[i]);

        size_t n;
        char32_t value;

        if (c < 0x80) {
            n = 1; value = c;
        }
        else if ((c & 0xE0) == 0xC0) {
            n = 2; value = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0) {
            n = 3; value = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0) {
            n = 4; value = c & 0x07;
        }
        else {
            xs.push_back(replacement);
            ++i;
            continue;
        }

        if (i + n > s.size()) {
            xs.push_back(replacement);
            break;
        }

        size_t j = 1;

        for (; j < n; ++j) {
            const auto cc = static_cast< unsigned char >(s[i + j]);

            if ((cc & 0xC0) != 0x80)
                break;

            value = (value << 6) | (cc & 0x3F);
        }

        if (j < n) {
            xs.push_back(replacement);
            i += j;
            continue;
        }

        xs.push_back(value);
        i += n;
    }

    return xs;
}

} // namespace vellum
