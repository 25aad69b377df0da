// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef I18_N_H_7720941835617290
#define I18_N_H_7720941835617290

#include <cstdint>
#include "string_tools.h"


//minimal layer marking user-visible text: no translation catalogs are shipped, source texts are used as-is

#define SFM_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s)        sfm::translate(SFM_TRANS_CONCAT_SUB(L, s))
#define _P(s, p, n) sfm::translate(SFM_TRANS_CONCAT_SUB(L, s), SFM_TRANS_CONCAT_SUB(L, p), n)
//source texts use %x as number placeholder for the plural form, which is substituted automatically


namespace sfm
{
inline
std::wstring translate(const std::wstring& text) { return text; }


inline
std::wstring translate(const std::wstring& singular, const std::wstring& plural, int64_t n)
{
    return replaceCpy(n == 1 || n == -1 ? singular : plural, L"%x", numberTo<std::wstring>(n));
}
}

#endif //I18_N_H_7720941835617290
