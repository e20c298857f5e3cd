// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_PATH_H_3984678473567247567
#define FILE_PATH_H_3984678473567247567

#include <optional>
#include "zstring.h"


namespace zen
{
std::optional<Zstring> getParentFolderPath(const Zstring& itemPath); //no value for root or relative single-item paths
inline Zstring getItemName(const Zstring& itemPath) { return afterLast(itemPath, Zstr("/"), IfNotFoundReturn::all); }

Zstring appendSeparator(Zstring path); //support rvalue references!

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

//remove trailing separators (except for root) and collapse duplicate separators
Zstring normalizeFolderPath(const Zstring& folderPath);

//itemPath lies inside folderPath? (byte-wise comparison, as native Linux paths)
bool isPathInsideFolder(const Zstring& itemPath, const Zstring& folderPath);

//both paths absolute; may produce "../" components, e.g. for manifests stored next to the media folder
Zstring getRelativePath(const Zstring& fromFolderPath, const Zstring& toItemPath);
}

#endif //FILE_PATH_H_3984678473567247567
