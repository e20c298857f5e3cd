// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef BASIC_MATH_H_3472639843265675
#define BASIC_MATH_H_3472639843265675

#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>
#include <type_traits>


namespace numeric
{
template <class T> bool isNull(T value); //...definitively fishy...

template <class T, class InputIterator> //precondition: range must be sorted!
auto roundToGrid(T val, InputIterator first, InputIterator last);








//################# inline implementation #########################
template <class T> inline
bool isNull(T value)
{
    using std::abs;
    return abs(value) <= std::numeric_limits<T>::epsilon(); //epsilon is 0 for integral types => less-equal
}


template <class T, class InputIterator> inline
auto roundToGrid(T val, InputIterator first, InputIterator last)
{
    assert(std::is_sorted(first, last));
    using ValueType = std::decay_t<decltype(*first)>;
    if (first == last)
        return static_cast<ValueType>(val);

    InputIterator it = std::lower_bound(first, last, val);
    if (it == last)
        return *--last;
    if (it == first)
        return *first;

    const auto nextVal = *it;
    const auto prevVal = *--it;
    return val - prevVal < nextVal - val ? prevVal : nextVal;
}
}


namespace zen
{
template <class T> inline
auto makeUnsigned(T t) { return static_cast<std::make_unsigned_t<T>>(t); }
}

#endif //BASIC_MATH_H_3472639843265675
