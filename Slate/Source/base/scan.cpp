// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "scan.h"
#include <algorithm>
#include <zen/file_traverser.h>
#include <zen/file_path.h>

using namespace zen;
using namespace slate;


namespace
{
struct ScannedFile
{
    Zstring fullPath;
    Zstring relPath; //relative to source root
    uint64_t fileSize = 0;
};


void scanFolder(const Zstring& folderPath, const Zstring& relPath, std::vector<ScannedFile>& output) //throw FileError
{
    std::vector<FileInfo> files;
    std::vector<FolderInfo> folders;

    traverseFolder(folderPath,
    [&](const   FileInfo& fi) {   files.push_back(fi); },
    [&](const FolderInfo& fi) { folders.push_back(fi); }, nullptr); //throw FileError

    std::sort(files.begin(), files.end(), [](const FileInfo& lhs, const FileInfo& rhs) { return lhs.itemName < rhs.itemName; });
    std::sort(folders.begin(), folders.end(), [](const FolderInfo& lhs, const FolderInfo& rhs) { return lhs.itemName < rhs.itemName; });

    for (const FileInfo& fi : files)
        output.push_back({fi.fullPath, appendPath(relPath, fi.itemName), fi.fileSize});

    for (const FolderInfo& fi : folders)
        scanFolder(fi.fullPath, appendPath(relPath, fi.itemName), output); //throw FileError
}
}


TransferJob slate::planTransferJob(const std::vector<Zstring>& sources,
                                   const std::vector<Zstring>& destinations,
                                   const JobOptions& options,
                                   bool createSourceFolder) //throw FileError
{
    TransferJob job;
    job.id = createJobId();
    job.options = options;

    for (const Zstring& destPath : destinations)
        job.destinations.push_back(normalizeFolderPath(destPath));

    for (const Zstring& sourcePath : sources)
    {
        const Zstring sourceRoot = normalizeFolderPath(sourcePath);
        job.sources.push_back(sourceRoot);

        std::vector<ScannedFile> files;
        scanFolder(sourceRoot, Zstring(), files); //throw FileError

        for (const ScannedFile& file : files)
        {
            TransferItem item;
            item.sourcePath = file.fullPath;

            for (const Zstring& destRoot : job.destinations)
            {
                const Zstring targetRoot = createSourceFolder ? appendPath(destRoot, getItemName(sourceRoot)) : destRoot;
                item.destPaths.push_back(appendPath(targetRoot, file.relPath));
            }
            job.totalBytes += file.fileSize;
            job.fileList.push_back(std::move(item));
        }
    }
    return job;
}
