// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef UTF_H_0294817349204813
#define UTF_H_0294817349204813

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>


namespace sfm
{
//convert between UTF-8 "char" strings and UTF-32 "wchar_t" strings (Linux: sizeof(wchar_t) == 4)
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);








//----------------------- implementation ----------------------------------
namespace impl
{
using CodePoint = uint32_t;
using Char8     = uint8_t;

const CodePoint REPLACEMENT_CHAR    = 0xfffd;
const CodePoint CODE_POINT_MAX      = 0x10ffff;
const CodePoint LEAD_SURROGATE      = 0xd800;
const CodePoint TRAIL_SURROGATE_MAX = 0xdfff;

static_assert(sizeof(wchar_t) == sizeof(CodePoint));


template <class Function> inline
void codePointToUtf8(CodePoint cp, Function writeOutput) //"writeOutput" is a unary function taking a Char8
{
    //https://en.wikipedia.org/wiki/UTF-8
    if (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX) //code points reserved for UTF-16
        cp = REPLACEMENT_CHAR;

    if (cp < 0x80)
        writeOutput(static_cast<Char8>(cp));
    else if (cp < 0x800)
    {
        writeOutput(static_cast<Char8>((cp >> 6  ) | 0xc0));
        writeOutput(static_cast<Char8>((cp & 0x3f) | 0x80));
    }
    else if (cp < 0x10000)
    {
        writeOutput(static_cast<Char8>( (cp >> 12       ) | 0xe0));
        writeOutput(static_cast<Char8>(((cp >> 6) & 0x3f) | 0x80));
        writeOutput(static_cast<Char8>( (cp & 0x3f      ) | 0x80));
    }
    else if (cp <= CODE_POINT_MAX)
    {
        writeOutput(static_cast<Char8>( (cp >> 18        ) | 0xf0));
        writeOutput(static_cast<Char8>(((cp >> 12) & 0x3f) | 0x80));
        writeOutput(static_cast<Char8>(((cp >> 6 ) & 0x3f) | 0x80));
        writeOutput(static_cast<Char8>( (cp & 0x3f       ) | 0x80));
    }
    else //invalid code point
        codePointToUtf8(REPLACEMENT_CHAR, writeOutput);
}


inline
size_t getUtf8Len(Char8 ch) //ch must be first code unit! returns 0 on error!
{
    if (ch < 0x80)
        return 1;
    if (ch >> 5 == 0x6)
        return 2;
    if (ch >> 4 == 0xe)
        return 3;
    if (ch >> 3 == 0x1e)
        return 4;
    return 0; //innvalid begin of UTF8 encoding
}


template <class Function> inline
void utf8ToCodePoint(std::string_view str, Function writeOutput) //"writeOutput" is a unary function taking a CodePoint
{
    auto it   = str.begin();
    auto last = str.end();

    while (it != last)
    {
        const Char8 lead = static_cast<Char8>(*it++);
        const size_t len = getUtf8Len(lead);
        if (len == 0)
        {
            writeOutput(REPLACEMENT_CHAR);
            continue;
        }

        CodePoint cp = len == 1 ? lead : lead & (0xff >> (len + 1));

        size_t i = 1;
        for (; i < len && it != last; ++i, ++it)
        {
            const Char8 ch = static_cast<Char8>(*it);
            if (ch >> 6 != 0x2) //not a continuation byte
                break;
            cp = (cp << 6) + (ch & 0x3f);
        }
        writeOutput(i == len ? cp : REPLACEMENT_CHAR);
    }
}
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    using SourceChar = typename std::remove_cvref_t<decltype(str[0])>;
    using TargetChar = typename TargetString::value_type;

    if constexpr (std::is_same_v<SourceChar, TargetChar>)
        return TargetString(str.begin(), str.end());
    else if constexpr (std::is_same_v<SourceChar, char>) //UTF-8 -> UTF-32
    {
        TargetString output;
        impl::utf8ToCodePoint(std::string_view(str.data(), str.size()), [&](impl::CodePoint cp) { output += static_cast<TargetChar>(cp); });
        return output;
    }
    else //UTF-32 -> UTF-8
    {
        static_assert(std::is_same_v<SourceChar, wchar_t> && std::is_same_v<TargetChar, char>);
        TargetString output;
        for (const wchar_t ch : str)
            impl::codePointToUtf8(static_cast<impl::CodePoint>(ch), [&](impl::Char8 c) { output += static_cast<char>(c); });
        return output;
    }
}
}

#endif //UTF_H_0294817349204813
