// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_traverser.h"
#include "file_path.h"
#include "basic_math.h"

    #include <sys/stat.h>
    #include <dirent.h>

using namespace zen;


namespace
{
inline
bool isDotEntry(const char* itemName)
{
    return itemName[0] == '.' &&
           (itemName[1] == 0 || (itemName[1] == '.' && itemName[2] == 0));
}
}


void zen::traverseFolder(const Zstring& dirPath,
                         const std::function<void(const FileInfo&    fi)>& onFile,
                         const std::function<void(const FolderInfo&  fi)>& onFolder,
                         const std::function<void(const SymlinkInfo& si)>& onSymlink) //throw FileError
{
    DIR* folder = ::opendir(dirPath.c_str()); //directory must NOT end with path separator, except "/"
    if (!folder)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot open directory %x."), L"%x", fmtPath(dirPath)), "opendir");
    ZEN_ON_SCOPE_EXIT(::closedir(folder)); //never close nullptr handles! -> crash

    for (;;)
    {
        errno = 0;
        const dirent* dirEntry = ::readdir(folder);
        if (!dirEntry)
        {
            if (errno == 0) //errno left unchanged => no more items
                return;

            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(dirPath)), "readdir");
        }

        if (isDotEntry(dirEntry->d_name))
            continue;

        const Zstring itemName = dirEntry->d_name;
        const Zstring itemPath = appendPath(dirPath, itemName);

        struct stat statData = {};
        if (::lstat(itemPath.c_str(), &statData) != 0) //lstat() does not resolve symlinks
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), "lstat");

        if (S_ISLNK(statData.st_mode))
        {
            if (onSymlink)
                onSymlink({itemName, itemPath});
        }
        else if (S_ISDIR(statData.st_mode))
        {
            if (onFolder)
                onFolder({itemName, itemPath});
        }
        else if (onFile) //S_ISREG, S_ISCHR, S_ISBLK, S_ISFIFO, S_ISSOCK
            onFile({itemName, itemPath, makeUnsigned(statData.st_size), statData.st_mtime});
    }
}
