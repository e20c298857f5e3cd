// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SCAN_H_8374650192837465
#define SCAN_H_8374650192837465

#include <zen/file_error.h>
#include "job.h"


namespace slate
{
/*  resolve source trees into a copy job:
    - each file maps to <destination>[/<source folder name>]/<relative path>
    - files in sorted order: folder content first, then sub folders
    - symlinks are not followed                                             */
TransferJob planTransferJob(const std::vector<Zstring>& sources,
                            const std::vector<Zstring>& destinations,
                            const JobOptions& options,
                            bool createSourceFolder); //throw FileError
}

#endif //SCAN_H_8374650192837465
