// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_path.h"

using namespace zen;


Zstring zen::appendSeparator(Zstring path) //support rvalue references!
{
    if (!endsWith(path, Zstr("/")))
        path += FILE_NAME_SEPARATOR;
    return path; //returning a by-value parameter => RVO if possible, r-value otherwise
}


Zstring zen::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    assert(!startsWith(relPath, Zstr("/")));
    if (relPath.empty())
        return basePath;
    if (basePath.empty())
        return relPath;

    return appendSeparator(basePath) + relPath;
}


Zstring zen::normalizeFolderPath(const Zstring& folderPath)
{
    Zstring output;
    for (const Zchar c : folderPath)
        if (c != FILE_NAME_SEPARATOR || !endsWith(output, Zstr("/")))
            output += c;

    if (output.size() > 1 && endsWith(output, Zstr("/")))
        output.pop_back();
    return output;
}


std::optional<Zstring> zen::getParentFolderPath(const Zstring& itemPath)
{
    const Zstring itemPathNorm = normalizeFolderPath(itemPath);

    const size_t pos = itemPathNorm.rfind(FILE_NAME_SEPARATOR);
    if (pos == Zstring::npos || itemPathNorm == Zstr("/"))
        return std::nullopt;

    if (pos == 0)
        return Zstring(Zstr("/"));

    return itemPathNorm.substr(0, pos);
}


bool zen::isPathInsideFolder(const Zstring& itemPath, const Zstring& folderPath)
{
    const Zstring folderPathNorm = normalizeFolderPath(folderPath);
    const Zstring itemPathNorm   = normalizeFolderPath(itemPath);

    return itemPathNorm == folderPathNorm ||
           startsWith(itemPathNorm, appendSeparator(folderPathNorm));
}


Zstring zen::getRelativePath(const Zstring& fromFolderPath, const Zstring& toItemPath)
{
    const std::vector<Zstring> fromParts = splitCpy(normalizeFolderPath(fromFolderPath), FILE_NAME_SEPARATOR, SplitOnEmpty::skip);
    const std::vector<Zstring> toParts   = splitCpy(normalizeFolderPath(toItemPath),     FILE_NAME_SEPARATOR, SplitOnEmpty::skip);

    size_t common = 0;
    while (common < fromParts.size() && common < toParts.size() && fromParts[common] == toParts[common])
        ++common;

    Zstring relPath;
    for (size_t i = common; i < fromParts.size(); ++i)
        relPath = appendPath(relPath, Zstr(".."));

    for (size_t i = common; i < toParts.size(); ++i)
        relPath = appendPath(relPath, toParts[i]);

    return relPath;
}
