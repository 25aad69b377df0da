// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef ZSTRING_H_7381940261538472
#define ZSTRING_H_7381940261538472

#include <string>
#include <string_view>


//native file path string: UTF-8 encoded on Linux, same encoding as the SFTP wire format
using Zchar = char;
#define Zstr(x) x
const Zchar FILE_NAME_SEPARATOR = '/';

using Zstring     = std::basic_string     <Zchar>;
using ZstringView = std::basic_string_view<Zchar>;

#endif //ZSTRING_H_7381940261538472
