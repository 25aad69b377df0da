// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "file_path.h"
#include <cassert>
#include <algorithm>
#include <unordered_map>

extern char** environ; //POSIX

using namespace sfm;


std::optional<Zstring> sfm::getParentFolderPath(const Zstring& itemPath)
{
    const Zstring path = removeTrailingSeparators(itemPath);
    if (path.empty() || path == Zstr("/"))
        return std::nullopt;

    const size_t pos = path.rfind(FILE_NAME_SEPARATOR);
    if (pos == Zstring::npos)
        return std::nullopt;
    if (pos == 0)
        return Zstring(Zstr("/"));

    return path.substr(0, pos);
}


Zstring sfm::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    assert(!startsWith(relPath, FILE_NAME_SEPARATOR));
    if (basePath.empty() || relPath.empty()) //relative base or nothing to append
        return basePath.empty() ? relPath : basePath;

    Zstring output;
    output.reserve(basePath.size() + 1 + relPath.size());
    output += basePath;
    if (!endsWith(basePath, FILE_NAME_SEPARATOR))
        output += FILE_NAME_SEPARATOR;
    output += relPath;
    return output;
}


Zstring sfm::removeTrailingSeparators(Zstring path)
{
    const size_t lastKept = path.find_last_not_of(FILE_NAME_SEPARATOR);
    path.resize(lastKept == Zstring::npos ? std::min<size_t>(path.size(), 1) : lastKept + 1); //only separators: keep root "/"
    return path;
}


std::optional<Zstring> sfm::getEnvironmentVar(const ZstringView name)
{
    //parsed once: getenv() races with setenv() of other threads
    static const std::unordered_map<Zstring, Zstring> envSnapshot = []
    {
        std::unordered_map<Zstring, Zstring> vars;
        for (char** it = environ; it && *it; ++it)
        {
            const ZstringView entry = *it;
            const size_t posEq = entry.find('=');
            if (posEq != ZstringView::npos && posEq > 0)
                vars.emplace(entry.substr(0, posEq), entry.substr(posEq + 1));
        }
        return vars;
    }();

    const auto it = envSnapshot.find(Zstring(name));
    if (it == envSnapshot.end())
        return std::nullopt;
    return it->second;
}
