// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_access.h"
#include <algorithm>
#include "file_traverser.h"
#include "scope_guard.h"

    #include <fcntl.h> //open, close, AT_SYMLINK_NOFOLLOW
    #include <unistd.h>

using namespace zen;


namespace
{
struct SysErrorCode : public zen::SysError
{
    SysErrorCode(const std::string& functionName, ErrorCode ec) : SysError(formatSystemError(functionName, ec)), errorCode(ec) {}

    const ErrorCode errorCode;
};


ItemType getItemTypeImpl(const Zstring& itemPath) //throw SysErrorCode
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        throw SysErrorCode("lstat", errno);

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}


struct stat getStatFollow(const Zstring& filePath) //throw SysError
{
    struct stat fileInfo = {};
    if (::stat(filePath.c_str(), &fileInfo) != 0)
        THROW_LAST_SYS_ERROR("stat");
    return fileInfo;
}
}


std::optional<ItemType> zen::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysErrorCode& e)
    {
        if (e.errorCode == ENOENT || e.errorCode == ENOTDIR)
            return std::nullopt;

        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), e.toString());
    }
}


uint64_t zen::getFileSize(const Zstring& filePath) //throw FileError
{
    try
    {
        return getStatFollow(filePath).st_size; //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath)), e.toString()); }
}


time_t zen::getFileModTime(const Zstring& filePath) //throw FileError
{
    try
    {
        return getStatFollow(filePath).st_mtime; //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read modification time of %x."), L"%x", fmtPath(filePath)), e.toString()); }
}


void zen::removeFilePlain(const Zstring& filePath) //throw FileError
{
    try
    {
        if (::unlink(filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}


void zen::removeDirectoryPlain(const Zstring& dirPath) //throw FileError
{
    try
    {
        if (::rmdir(dirPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("rmdir");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(dirPath)), e.toString()); }
}


void zen::removeSymlinkPlain(const Zstring& linkPath) //throw FileError
{
    try
    {
        if (::unlink(linkPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete symbolic link %x."), L"%x", fmtPath(linkPath)), e.toString()); }
}


namespace
{
void removeDirectoryImpl(const Zstring& folderPath) //throw FileError
{
    std::vector<Zstring> folderPaths;
    {
        std::vector<Zstring> filePaths;
        std::vector<Zstring> symlinkPaths;

        traverseFolder(folderPath,
        [&](const    FileInfo& fi) {    filePaths.push_back(fi.fullPath); },
        [&](const  FolderInfo& fi) {  folderPaths.push_back(fi.fullPath); },
        [&](const SymlinkInfo& si) { symlinkPaths.push_back(si.fullPath); }); //throw FileError

        for (const Zstring& filePath : filePaths)
            removeFilePlain(filePath); //throw FileError

        for (const Zstring& symlinkPath : symlinkPaths)
            removeSymlinkPlain(symlinkPath); //throw FileError
    } //=> save stack space and allow deletion of deep hierarchies!

    for (const Zstring& subFolderPath : folderPaths)
        removeDirectoryImpl(subFolderPath); //throw FileError

    removeDirectoryPlain(folderPath); //throw FileError
}
}


void zen::removeDirectoryPlainRecursion(const Zstring& dirPath) //throw FileError
{
    try
    {
        if (getItemTypeImpl(dirPath) == ItemType::symlink) //throw SysErrorCode
            removeSymlinkPlain(dirPath); //throw FileError
        else
            removeDirectoryImpl(dirPath); //throw FileError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(dirPath)), e.toString()); }
}


void zen::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) //throw FileError, ErrorTargetExisting
{
    auto getErrorMsg = [&]
    {
        return replaceCpy(replaceCpy(_("Cannot move %x to %y."),
                                     L"%x", fmtPath(pathFrom)),
                          L"%y", fmtPath(pathTo));
    };

    //rename() will never fail with EEXIST, but always (atomically) overwrite!
    if (!replaceExisting)
    {
        struct stat targetInfo = {};
        if (::lstat(pathTo.c_str(), &targetInfo) == 0)
            throw ErrorTargetExisting(getErrorMsg(), replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(pathTo))));
        if (errno != ENOENT)
            throw FileError(getErrorMsg(), formatSystemError("lstat(target)", errno));
    }

    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
        THROW_LAST_FILE_ERROR(getErrorMsg(), "rename");
}


void zen::setFileTime(const Zstring& filePath, time_t modTime, ProcSymlink procSl) //throw FileError
{
    const timespec newTimes[2]
    {
        {.tv_sec = ::time(nullptr)}, //access time; don't use UTIME_NOW/UTIME_OMIT
        {.tv_sec = modTime},
    };

    if (::utimensat(AT_FDCWD, filePath.c_str(), newTimes, procSl == ProcSymlink::asLink ? AT_SYMLINK_NOFOLLOW : 0) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write modification time of %x."), L"%x", fmtPath(filePath)), "utimensat");
}


void zen::createDirectory(const Zstring& dirPath) //throw FileError, ErrorTargetExisting
{
    try
    {
        //don't allow creating irregular folders!
        const Zstring dirName = getItemName(dirPath);

        if (std::all_of(dirName.begin(), dirName.end(), [](Zchar c) { return c == Zstr('.'); }))
        /**/throw SysError(replaceCpy<std::wstring>(L"Invalid folder name %x.", L"%x", fmtPath(dirName)));

        const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

        if (::mkdir(dirPath.c_str(), mode) != 0)
        {
            const int ec = errno; //copy before directly or indirectly making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), formatSystemError("mkdir", ec));
            THROW_LAST_SYS_ERROR("mkdir");
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), e.toString()); }
}


void zen::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    //- path most likely already exists => check first
    //- find first existing parent folder (backwards iteration):
    Zstring dirPathEx = dirPath;
    std::vector<Zstring> dirNames; //reverse order
    for (;;)
    {
        const std::optional<ItemType> type = getItemTypeIfExists(dirPathEx); //throw FileError
        if (type)
        {
            if (*type == ItemType::file /*obscure, but possible*/)
                throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)),
                                replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(dirPathEx))));
            break;
        }

        const std::optional<Zstring> parentPath = getParentFolderPath(dirPathEx);
        if (!parentPath) //relative single-item path
        {
            dirNames.push_back(dirPathEx);
            dirPathEx.clear();
            break;
        }
        dirNames.push_back(getItemName(dirPathEx));
        dirPathEx = *parentPath;
    }

    Zstring dirPathNew = dirPathEx;
    for (auto it = dirNames.rbegin(); it != dirNames.rend(); ++it)
    {
        dirPathNew = appendPath(dirPathNew, *it);
        try
        {
            createDirectory(dirPathNew); //throw FileError, ErrorTargetExisting
        }
        catch (ErrorTargetExisting&) {} //possible, if createDirectoryIfMissingRecursion() is run in parallel
    }
}


Zstring zen::getAbsolutePath(const Zstring& itemPath) //throw FileError
{
    if (startsWith(itemPath, Zstr("/")))
        return normalizeFolderPath(itemPath);

    std::vector<char> buffer(10000);
    if (!::getcwd(buffer.data(), buffer.size()))
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot determine absolute path of %x."), L"%x", fmtPath(itemPath)), "getcwd");

    Zstring relPath = itemPath;
    while (startsWith(relPath, Zstr("./")))
        relPath = afterFirst(relPath, Zstr("/"), IfNotFoundReturn::none);
    if (relPath == Zstr("."))
        relPath.clear();

    return normalizeFolderPath(appendPath(buffer.data(), normalizeFolderPath(relPath)));
}
