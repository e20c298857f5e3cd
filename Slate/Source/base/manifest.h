// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef MANIFEST_H_6501928374650192
#define MANIFEST_H_6501928374650192

#include <zen/file_error.h>
#include "job.h"


namespace slate
{
const char MHL_NAMESPACE[] = "http://www.movielabs.com/ACF/MHL/v1.0";

/*  Media Hash List:
    - accepts namespaced and plain <hashlist>/<hash> documents
    - xxhash64 is preferred over md5 if a <hash> element carries both
    - entries without file or hash are skipped                       */
std::vector<ManifestEntry> parseMhlFile(const Zstring& filePath); //throw FileError

//one <hash> element per verified destination; <file> is relative to the manifest's folder
void saveMhlFile(const TransferJob& job, const Zstring& filePath); //throw FileError

VerifyJob makeVerifyJob(const Zstring& manifestPath, const Zstring& targetDir); //throw FileError
}

#endif //MANIFEST_H_6501928374650192
