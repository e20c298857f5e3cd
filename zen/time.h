// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TIME_H_8457092814324342453627
#define TIME_H_8457092814324342453627

#include <ctime>
#include "zstring.h"


namespace zen
{
struct TimeComp //replaces std::tm
{
    int year   = 0; // -
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60 (including leap second)

    bool operator==(const TimeComp&) const = default;
};

TimeComp getLocalTime(time_t utc); //convert time_t (UTC) to local time components, returns TimeComp() on error
TimeComp getLocalTime(); //utc = std::time()

/* format (current) date and time; example:
            formatTime(Zstr("%Y|%m|%d")); -> "2011|10|29"
            formatTime(formatIsoDateTag); -> "2011-10-29"
            formatTime(formatIsoTimeTag); -> "17:55:34"                       */
Zstring formatTime(const Zchar* format, const TimeComp& tc = getLocalTime()); //format as specified by "std::strftime", returns empty string on error

const Zchar* const formatIsoDateTag     = Zstr("%Y-%m-%d");          //e.g. 2001-08-23
const Zchar* const formatIsoTimeTag     = Zstr("%H:%M:%S");          //e.g. 14:55:02
const Zchar* const formatIsoDateTimeTag = Zstr("%Y-%m-%d %H:%M:%S"); //e.g. 2001-08-23 14:55:02
const Zchar* const formatXmlDateTimeTag = Zstr("%Y-%m-%dT%H:%M:%S"); //e.g. 2001-08-23T14:55:02

//format: [-][HH:]MM:SS    e.g. 1:23:45
Zstring formatTimeSpan(int64_t timeInSec, bool hourOptional = false);









//############################ implementation ##############################
namespace impl
{
inline
std::tm toClibTimeComponents(const TimeComp& tc)
{
    std::tm ctc{};
    ctc.tm_year  = tc.year - 1900; //years since 1900
    ctc.tm_mon   = tc.month - 1;   //0-11
    ctc.tm_mday  = tc.day;         //1-31
    ctc.tm_hour  = tc.hour;        //0-23
    ctc.tm_min   = tc.minute;      //0-59
    ctc.tm_sec   = tc.second;      //0-60 (including leap second)
    ctc.tm_isdst = -1;             //> 0 if DST is active, == 0 if DST is not active, < 0 if the information is not available
    return ctc;
}


inline
TimeComp toZenTimeComponents(const std::tm& ctc)
{
    TimeComp tc;
    tc.year   = ctc.tm_year + 1900;
    tc.month  = ctc.tm_mon + 1;
    tc.day    = ctc.tm_mday;
    tc.hour   = ctc.tm_hour;
    tc.minute = ctc.tm_min;
    tc.second = ctc.tm_sec;
    return tc;
}
}


inline
TimeComp getLocalTime(time_t utc)
{
    std::tm ctc{};
    if (!::localtime_r(&utc, &ctc)) //thread-safe
        return TimeComp();
    return impl::toZenTimeComponents(ctc);
}


inline
TimeComp getLocalTime() { return getLocalTime(std::time(nullptr)); }


inline
Zstring formatTime(const Zchar* format, const TimeComp& tc)
{
    if (tc == TimeComp()) //failure code from getLocalTime()
        return Zstring();

    std::tm ctc = impl::toClibTimeComponents(tc);
    std::mktime(&ctc); //unfortunately std::strftime() needs all elements of "struct tm" filled, e.g. tm_wday, tm_yday

    Zchar buffer[256] = {};
    const size_t charsWritten = std::strftime(buffer, 256, format, &ctc);
    return Zstring(buffer, charsWritten);
}


inline
Zstring formatTimeSpan(int64_t timeInSec, bool hourOptional)
{
    Zstring timeSpanFmt;
    if (timeInSec < 0)
    {
        timeSpanFmt += Zstr('-');
        timeInSec = -timeInSec;
    }

    const int64_t hours = timeInSec / 3600;
    if (hours > 0 || !hourOptional)
        timeSpanFmt += numberTo<Zstring>(hours) + Zstr(':');

    timeSpanFmt += printNumber<Zstring>(Zstr("%02d"), static_cast<int>(timeInSec / 60 % 60)) + Zstr(':') +
                   printNumber<Zstring>(Zstr("%02d"), static_cast<int>(timeInSec % 60));
    return timeSpanFmt;
}
}

#endif //TIME_H_8457092814324342453627
