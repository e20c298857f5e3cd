// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef UTF_H_01832479146991573473545
#define UTF_H_01832479146991573473545

#include <cstdint>
#include <string>
#include <string_view>
#include <optional>


namespace zen
{
//convert between UTF-8 (std::string) and UTF-32 (std::wstring on Linux)
template <class TargetString> TargetString utfTo(std::string_view  str);
template <class TargetString> TargetString utfTo(std::wstring_view str);

size_t unicodeLength(std::string_view str); //number of code points (+ correctly handle broken UTF encoding)








//######################## implementation ########################
namespace impl
{
using CodePoint = uint32_t;

const CodePoint REPLACEMENT_CHAR    = 0xfffd;
const CodePoint CODE_POINT_MAX      = 0x10ffff;
const CodePoint LEAD_SURROGATE      = 0xd800;
const CodePoint TRAIL_SURROGATE_MAX = 0xdfff;

static_assert(sizeof(wchar_t) == 4, "UTF-32 wchar_t expected");


class Utf8Decoder
{
public:
    explicit Utf8Decoder(std::string_view str) : it_(str.begin()), last_(str.end()) {}

    std::optional<CodePoint> getNext()
    {
        if (it_ == last_)
            return std::nullopt;

        const unsigned char ch = static_cast<unsigned char>(*it_++);
        CodePoint cp = ch;
        int trailCount = 0;

        if (ch < 0x80)
            return cp;
        else if ((ch >> 5) == 0x6) { cp = ch & 0x1f; trailCount = 1; }
        else if ((ch >> 4) == 0xe) { cp = ch & 0x0f; trailCount = 2; }
        else if ((ch >> 3) == 0x1e) { cp = ch & 0x07; trailCount = 3; }
        else
            return REPLACEMENT_CHAR;

        for (int i = 0; i < trailCount; ++i)
        {
            if (it_ == last_ || (static_cast<unsigned char>(*it_) >> 6) != 0x2)
                return REPLACEMENT_CHAR; //don't consume: next lead byte gets a fresh start
            cp = (cp << 6) | (static_cast<unsigned char>(*it_++) & 0x3f);
        }

        if (cp > CODE_POINT_MAX || (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX))
            return REPLACEMENT_CHAR;
        return cp;
    }

private:
    std::string_view::const_iterator it_;
    std::string_view::const_iterator last_;
};


inline
void codePointToUtf8(CodePoint cp, std::string& output)
{
    if (cp > CODE_POINT_MAX || (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX))
        cp = REPLACEMENT_CHAR;

    if (cp < 0x80)
        output += static_cast<char>(cp);
    else if (cp < 0x800)
    {
        output += static_cast<char>((cp >> 6) | 0xc0);
        output += static_cast<char>((cp & 0x3f) | 0x80);
    }
    else if (cp < 0x10000)
    {
        output += static_cast<char>((cp >> 12) | 0xe0);
        output += static_cast<char>(((cp >> 6) & 0x3f) | 0x80);
        output += static_cast<char>((cp & 0x3f) | 0x80);
    }
    else
    {
        output += static_cast<char>((cp >> 18) | 0xf0);
        output += static_cast<char>(((cp >> 12) & 0x3f) | 0x80);
        output += static_cast<char>(((cp >> 6) & 0x3f) | 0x80);
        output += static_cast<char>((cp & 0x3f) | 0x80);
    }
}


inline std::string  convert(std::string_view str, std::string*) { return std::string(str); }
inline std::wstring convert(std::wstring_view str, std::wstring*) { return std::wstring(str); }

inline
std::wstring convert(std::string_view str, std::wstring*)
{
    std::wstring output;
    output.reserve(str.size());
    Utf8Decoder decoder(str);
    while (const std::optional<CodePoint> cp = decoder.getNext())
        output += static_cast<wchar_t>(*cp);
    return output;
}

inline
std::string convert(std::wstring_view str, std::string*)
{
    std::string output;
    output.reserve(str.size());
    for (const wchar_t c : str)
        codePointToUtf8(static_cast<CodePoint>(c), output);
    return output;
}
}


template <class TargetString> inline
TargetString utfTo(std::string_view str) { return impl::convert(str, static_cast<TargetString*>(nullptr)); }

template <class TargetString> inline
TargetString utfTo(std::wstring_view str) { return impl::convert(str, static_cast<TargetString*>(nullptr)); }


inline
size_t unicodeLength(std::string_view str)
{
    size_t uniLen = 0;
    impl::Utf8Decoder decoder(str);
    while (decoder.getNext())
        ++uniLen;
    return uniLen;
}
}

#endif //UTF_H_01832479146991573473545
