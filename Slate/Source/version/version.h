// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef VERSION_H_1827364509128374
#define VERSION_H_1827364509128374

namespace slate
{
const char slateVersion[] = "1.2";
}

#endif //VERSION_H_1827364509128374
