// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef I18_N_H_3843489325044253425456
#define I18_N_H_3843489325044253425456

#include "string_tools.h"
#include "format_unit.h"


//minimal layer marking user-visible text - without platform/library dependencies!

#define ZEN_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s)        zen::translate(ZEN_TRANS_CONCAT_SUB(L, s))
#define _P(s, p, n) zen::translate(ZEN_TRANS_CONCAT_SUB(L, s), ZEN_TRANS_CONCAT_SUB(L, p), n)
//plural form: source must use %x as number placeholder, which will be substituted automatically!!!

namespace zen
{
inline
std::wstring translate(const wchar_t* text) { return text; }


//translate plural forms: "%x day" "%x days"
//returns "1 day" if n == 1; "123 days" if n == 123 for english language
template <class T> inline
std::wstring translate(const wchar_t* singular, const wchar_t* plural, T n)
{
    static_assert(sizeof(n) <= sizeof(int64_t));
    const auto n64 = static_cast<int64_t>(n);

    assert(contains(std::wstring(plural), L"%x"));
    return replaceCpy(std::wstring(n64 == 1 || n64 == -1 ? singular : plural), L"%x", formatNumber(n64));
}
}

#endif //I18_N_H_3843489325044253425456
