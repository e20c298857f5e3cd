// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef CONFIG_H_8127364509812736
#define CONFIG_H_8127364509812736

#include <zen/file_error.h>
#include "base/structures.h"


namespace slate
{
struct GlobalConfig
{
    size_t maxConcurrentJobs = 1; //>= 1
    bool deferPostProcess = false;

    JobOptions defaultJobOptions;

    Zstring logFolderPath; //empty: no log files
    int logfilesMaxAgeDays = 14; //<= 0: keep all

    bool operator==(const GlobalConfig&) const = default;
};

GlobalConfig readConfig(const Zstring& filePath); //throw FileError; missing file: return defaults
void writeConfig(const GlobalConfig& cfg, const Zstring& filePath); //throw FileError
}

#endif //CONFIG_H_8127364509812736
