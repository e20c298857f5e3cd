// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ZSTRING_H_73425873425789
#define ZSTRING_H_73425873425789

#include <stdexcept> //not used by this header, but the "rest of the world" needs it!
#include "string_tools.h"


//native path and file name strings: UTF-8 on Linux
using Zchar = char;
#define Zstr(x) x

using Zstring = std::string;
using ZstringView = std::basic_string_view<Zchar>;

const Zchar FILE_NAME_SEPARATOR = '/';

//common Unicode characters
const wchar_t* const ELLIPSIS = L"…"; //…
const wchar_t* const TAB_SPACE = L"    "; //4: the only sensible space count for tabs

#endif //ZSTRING_H_73425873425789
