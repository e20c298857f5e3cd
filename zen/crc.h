// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CRC_H_23489275827847235
#define CRC_H_23489275827847235

#include <string>
#include <boost/crc.hpp>


namespace zen
{
inline
uint16_t getCrc16(const std::string& str)
{
    boost::crc_16_type result;
    if (!str.empty())
        result.process_bytes(str.data(), str.size());
    auto rv = result.checksum();
    static_assert(sizeof(rv) == sizeof(uint16_t));
    return rv;
}
}

#endif //CRC_H_23489275827847235
