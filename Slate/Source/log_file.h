// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef LOG_FILE_H_5019283746501928
#define LOG_FILE_H_5019283746501928

#include <zen/file_error.h>
#include "base/job.h"


namespace slate
{
//"Job_1a2b3c4d 2025-10-19 153012.log"
Zstring generateLogFileName(const Job& job);

//write plain-text log of a finished job, then delete logs older than logfilesMaxAgeDays (<= 0: no limit)
Zstring saveLogFile(const Job& job, const Zstring& logFolderPath, int logfilesMaxAgeDays); //throw FileError; returns log file path
}

#endif //LOG_FILE_H_5019283746501928
