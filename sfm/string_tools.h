// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef STRING_TOOLS_H_6021937465023812
#define STRING_TOOLS_H_6021937465023812

#include <cassert>
#include <charconv>
#include <cstdio>  //snprintf
#include <cwchar>  //swprintf
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>


//non-member helpers for std::string, std::wstring and their views
namespace sfm
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only

//S and T can be strings, string views, char/wchar_t arrays or a single char/wchar_t
template <class S, class T> bool contains  (const S& str, const T& term);
template <class S, class T> bool startsWith(const S& str, const T& prefix);
template <class S, class T> bool endsWith  (const S& str, const T& postfix);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class S, class Char> [[nodiscard]] std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe);

template <class S> [[nodiscard]] S trimCpy(const S& str);

template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U>            void replace   (S& str, const T& oldTerm, const U& newTerm);

//locale-independent conversion between numbers and strings
template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str); //returns 0 on error

template <class S, class T, class Num> S printNumber(const T& format, const Num& number); //format a single number using std::snprintf()










//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return c == static_cast<Char>(' ')  || c == static_cast<Char>('\t') ||
           c == static_cast<Char>('\n') || c == static_cast<Char>('\r') ||
           c == static_cast<Char>('\f') || c == static_cast<Char>('\v');
}


template <class Char> inline
bool isDigit(Char c) { return static_cast<Char>('0') <= c && c <= static_cast<Char>('9'); }


namespace impl
{
template <class Char> inline std::basic_string_view<Char> strView(const std::basic_string<Char>& str) { return str; }
template <class Char> inline std::basic_string_view<Char> strView(std::basic_string_view<Char>   str) { return str; }
template <class Char> inline std::basic_string_view<Char> strView(const Char* str)                    { return str; }

template <class Char> requires std::is_integral_v<Char>
inline std::basic_string_view<Char> strView(const Char& ch) { return {&ch, 1}; } //view is valid while the argument lives
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    return impl::strView(str).find(impl::strView(term)) != std::basic_string_view<typename S::value_type>::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix) { return impl::strView(str).starts_with(impl::strView(prefix)); }


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix) { return impl::strView(str).ends_with(impl::strView(postfix)); }


namespace impl
{
//split "str" around the match of "term" at "pos"
template <class S, class T> inline
S getSplitPart(const S& str, const T& term, size_t pos, bool partAfter, IfNotFoundReturn infr)
{
    const auto strV  = strView(str);
    const auto termV = strView(term);
    assert(!termV.empty());

    if (pos == strV.npos)
        return infr == IfNotFoundReturn::all ? S(strV) : S();

    return S(partAfter ? strV.substr(pos + termV.size()) : strV.substr(0, pos));
}
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    return impl::getSplitPart(str, term, impl::strView(str).rfind(impl::strView(term)), true, infr);
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    return impl::getSplitPart(str, term, impl::strView(str).find(impl::strView(term)), true, infr);
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    return impl::getSplitPart(str, term, impl::strView(str).find(impl::strView(term)), false, infr);
}


template <class S, class Char> inline
std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe)
{
    std::vector<S> output;
    const auto strV = impl::strView(str);

    for (size_t first = 0;;)
    {
        const size_t pos = strV.find(delimiter, first);
        const auto part = strV.substr(first, pos == strV.npos ? strV.npos : pos - first);

        if (!part.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(part);

        if (pos == strV.npos)
            return output;
        first = pos + 1;
    }
}


template <class S> inline
S trimCpy(const S& str)
{
    const auto strV = impl::strView(str);

    size_t first = 0;
    size_t last  = strV.size();
    while (first < last && isWhiteSpace(strV[first]))
        ++first;
    while (last > first && isWhiteSpace(strV[last - 1]))
        --last;

    return S(strV.substr(first, last - first));
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    const auto oldV = impl::strView(oldTerm);
    const auto newV = impl::strView(newTerm);
    assert(!oldV.empty());
    if (oldV.empty())
        return;

    size_t pos = str.find(oldV);
    if (pos == S::npos)
        return;

    S output;
    size_t copied = 0;
    do
    {
        output.append(str, copied, pos - copied).append(newV);
        copied = pos + oldV.size();
        pos = str.find(oldV, copied);
    }
    while (pos != S::npos);

    output.append(str, copied);
    str = std::move(output);
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    char buffer[128];
    //floating point: shortest representation that round-trips
    const auto [ptr, ec] = std::to_chars(std::begin(buffer), std::end(buffer), number);
    if (ec != std::errc())
    {
        assert(false);
        return S();
    }
    return S(buffer, ptr); //char -> wchar_t: digits are ASCII
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    std::string tmp;
    for (const auto c : impl::strView(str))
        tmp += static_cast<char>(c); //non-ASCII chars fail parsing below

    const std::string trimmed = trimCpy(tmp);
    const std::string_view strV = trimmed;
    const char* first = strV.data();
    if constexpr (std::is_unsigned_v<Num>)
        if (!strV.empty() && strV.front() == '+')
            ++first;

    Num number = 0;
    const auto [ptr, ec] = std::from_chars(first, strV.data() + strV.size(), number);
    if (ec != std::errc() || ptr != strV.data() + strV.size())
        return 0;
    return number;
}


namespace impl
{
template <class Num> inline
int saferPrintf(char* buffer, size_t bufferSize, const char* format, const Num& number)
{
    return std::snprintf(buffer, bufferSize, format, number); //returns number of chars written if successful, < 0 or >= bufferSize on error
}

template <class Num> inline
int saferPrintf(wchar_t* buffer, size_t bufferSize, const wchar_t* format, const Num& number)
{
    return std::swprintf(buffer, bufferSize, format, number); //returns number of chars written if successful, < 0 on error (including buffer too small)
}
}


template <class S, class T, class Num> inline
S printNumber(const T& format, const Num& number)
{
    using Char = typename S::value_type;
    S buf(128, static_cast<Char>('0'));
    const int charsWritten = impl::saferPrintf(buf.data(), buf.size(), impl::strView(format).data(), number); //format must be null-terminated!

    if (charsWritten < 0 || static_cast<size_t>(charsWritten) > buf.size())
    {
        assert(false);
        return S();
    }

    buf.resize(charsWritten);
    return buf;
}
}

#endif //STRING_TOOLS_H_6021937465023812
