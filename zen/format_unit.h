// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FORMAT_UNIT_H_9813475809345
#define FORMAT_UNIT_H_9813475809345

#include <cstdint>
#include <string>


namespace zen
{
const int bytesPerKilo = 1000;

std::wstring formatFilesizeShort(int64_t filesize);
std::wstring formatRemainingTime(double timeInSec);
std::wstring formatProgressPercent(double fraction /*[0, 1]*/, int decPlaces = 0 /*[0, 9]*/); //rounded down!

std::wstring formatThreeDigitPrecision(double value); //format with fixed number of digits (unless value is too large)

std::wstring formatNumber(int64_t n); //format integer number including thousands separator
}

#endif //FORMAT_UNIT_H_9813475809345
