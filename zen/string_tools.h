// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <cassert>
#include <charconv>
#include <cstdio>
#include <cwchar>
#include <cstdlib>
#include <vector>
#include <type_traits>
#include "utf.h"


//string functions for std::string and std::wstring
namespace zen
{
template <class S> using StrViewOf = std::type_identity_t<std::basic_string_view<typename S::value_type>>;

template <class Char> bool isWhiteSpace(Char c);
template <class Char> Char asciiToLower(Char c);
template <class Char> Char asciiToUpper(Char c);

template <class S> bool contains  (const S& str, StrViewOf<S> term);
template <class S> bool contains  (const S& str, typename S::value_type c);
template <class S> bool startsWith(const S& str, StrViewOf<S> prefix);
template <class S> bool endsWith  (const S& str, StrViewOf<S> postfix);
template <class S> bool equalAsciiNoCase(const S& lhs, StrViewOf<S> rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S> S afterLast  (const S& str, StrViewOf<S> term, IfNotFoundReturn infr);
template <class S> S afterFirst (const S& str, StrViewOf<S> term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class S> [[nodiscard]] std::vector<S> splitCpy(const S& str, typename S::value_type delimiter, SplitOnEmpty soe);

template <class S> [[nodiscard]] S trimCpy(const S& str);
template <class S> void trim(S& str);

template <class S> [[nodiscard]] S replaceCpy(S  str, StrViewOf<S> oldTerm, StrViewOf<S> newTerm);
template <class S>            void replace   (S& str, StrViewOf<S> oldTerm, StrViewOf<S> newTerm);

template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str);

std::string formatAsHexString(std::string_view blob); //bytes -> lower-case hex string

template <class S, class Num> S printNumber(const typename S::value_type* format, const Num& number); //format a single number using std::snprintf()








//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    //caveat: std::isspace() takes an int, but expects an unsigned char
    return c == Char(' ') || c == Char('\t') || c == Char('\n') || c == Char('\r') || c == Char('\v') || c == Char('\f');
}


template <class Char> inline
Char asciiToLower(Char c)
{
    if (Char('A') <= c && c <= Char('Z'))
        return static_cast<Char>(c - Char('A') + Char('a'));
    return c;
}


template <class Char> inline
Char asciiToUpper(Char c)
{
    if (Char('a') <= c && c <= Char('z'))
        return static_cast<Char>(c - Char('a') + Char('A'));
    return c;
}


template <class S> inline
bool contains(const S& str, StrViewOf<S> term) { return str.find(term) != S::npos; }


template <class S> inline
bool contains(const S& str, typename S::value_type c) { return str.find(c) != S::npos; }


template <class S> inline
bool startsWith(const S& str, StrViewOf<S> prefix)
{
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}


template <class S> inline
bool endsWith(const S& str, StrViewOf<S> postfix)
{
    return str.size() >= postfix.size() && str.compare(str.size() - postfix.size(), postfix.size(), postfix) == 0;
}


template <class S> inline
bool equalAsciiNoCase(const S& lhs, StrViewOf<S> rhs)
{
    if (lhs.size() != rhs.size())
        return false;
    for (size_t i = 0; i < lhs.size(); ++i)
        if (asciiToLower(lhs[i]) != asciiToLower(rhs[i]))
            return false;
    return true;
}


template <class S> inline
S afterLast(const S& str, StrViewOf<S> term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.rfind(term);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return str.substr(pos + term.size());
}


template <class S> inline
S afterFirst(const S& str, StrViewOf<S> term, IfNotFoundReturn infr)
{
    assert(!term.empty());
    const size_t pos = str.find(term);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return str.substr(pos + term.size());
}


template <class S> inline
std::vector<S> splitCpy(const S& str, typename S::value_type delimiter, SplitOnEmpty soe)
{
    std::vector<S> output;
    for (size_t first = 0;;)
    {
        const size_t last = str.find(delimiter, first);
        S part = str.substr(first, last == S::npos ? S::npos : last - first);
        if (!part.empty() || soe == SplitOnEmpty::allow)
            output.push_back(std::move(part));
        if (last == S::npos)
            return output;
        first = last + 1;
    }
}


template <class S> inline
void trim(S& str)
{
    size_t first = 0;
    size_t last  = str.size();
    while (first < last && isWhiteSpace(str[first]))
        ++first;
    while (last > first && isWhiteSpace(str[last - 1]))
        --last;
    str = str.substr(first, last - first);
}


template <class S> inline
S trimCpy(const S& str)
{
    S tmp = str;
    trim(tmp);
    return tmp;
}


template <class S> inline
void replace(S& str, StrViewOf<S> oldTerm, StrViewOf<S> newTerm)
{
    assert(!oldTerm.empty());
    if (oldTerm.empty())
        return;

    S output;
    size_t first = 0;
    for (size_t pos = str.find(oldTerm); pos != S::npos; pos = str.find(oldTerm, first))
    {
        output.append(str, first, pos - first);
        output += newTerm;
        first = pos + oldTerm.size();
    }
    if (first == 0) //nothing found
        return;
    output.append(str, first, S::npos);
    str = std::move(output);
}


template <class S> inline
S replaceCpy(S str, StrViewOf<S> oldTerm, StrViewOf<S> newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    std::string tmp;
    if constexpr (std::is_floating_point_v<Num>)
        tmp = printNumber<std::string>("%g", static_cast<double>(number));
    else
        tmp = std::to_string(number);

    if constexpr (std::is_same_v<S, std::string>)
        return tmp;
    else
        return utfTo<S>(tmp);
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_arithmetic_v<Num>);
    const std::string tmp = trimCpy(utfTo<std::string>(str));

    if constexpr (std::is_floating_point_v<Num>)
        return static_cast<Num>(std::strtod(tmp.c_str(), nullptr));
    else
    {
        Num number = 0;
        const char* first = tmp.c_str();
        if (!tmp.empty() && tmp[0] == '+')
            ++first;
        if (std::from_chars(first, tmp.c_str() + tmp.size(), number).ec != std::errc())
            return 0;
        return number;
    }
}


inline
std::string formatAsHexString(std::string_view blob)
{
    const char* const digits = "0123456789abcdef";
    std::string output;
    output.reserve(blob.size() * 2);
    for (const char c : blob)
    {
        output += digits[static_cast<unsigned char>(c) / 16];
        output += digits[static_cast<unsigned char>(c) % 16];
    }
    return output;
}


template <class S, class Num> inline
S printNumber(const typename S::value_type* format, const Num& number)
{
    static_assert(std::is_arithmetic_v<Num>);
    assert(std::string_view(utfTo<std::string>(format)).find('%') != std::string_view::npos);

    typename S::value_type buffer[128] = {}; //zero-initialize!
    int charsWritten = 0;
    if constexpr (std::is_same_v<typename S::value_type, char>)
        charsWritten = std::snprintf(buffer, std::size(buffer), format, number);
    else
        charsWritten = std::swprintf(buffer, std::size(buffer), format, number);

    return 0 < charsWritten && charsWritten < static_cast<int>(std::size(buffer)) ? S(buffer, charsWritten) : S();
}
}

#endif //STRING_TOOLS_H_213458973046
