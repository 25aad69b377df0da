// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_5107348232916450
#define SCOPE_GUARD_H_5107348232916450

#include <exception>
#include <utility>

/*  run code when leaving the current scope:
        SFM_ON_SCOPE_EXIT(::close(fd));          always
        SFM_ON_SCOPE_FAIL(::unlink(tmpPath));    only while an exception propagates

    cleanup code running during stack unwinding must not throw  */

namespace sfm
{
namespace impl
{
template <bool onFailOnly, class Function>
class ScopeGuard
{
public:
    explicit ScopeGuard(Function&& fun) : fun_(std::move(fun)) {}

    ~ScopeGuard() noexcept(onFailOnly)
    {
        if (!onFailOnly || std::uncaught_exceptions() > exceptionCount_)
            fun_(); //throw X
    }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    Function fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
};


template <bool onFailOnly, class Function> inline
ScopeGuard<onFailOnly, Function> makeScopeGuard(Function&& fun) { return ScopeGuard<onFailOnly, Function>(std::move(fun)); }
}
}

#define SFM_GUARD_NAME_SUB(line) scopeGuard ## line
#define SFM_GUARD_NAME(line) SFM_GUARD_NAME_SUB(line)

#define SFM_ON_SCOPE_EXIT(X) [[maybe_unused]] auto SFM_GUARD_NAME(__LINE__) = sfm::impl::makeScopeGuard<false>([&]{ X; });
#define SFM_ON_SCOPE_FAIL(X) [[maybe_unused]] auto SFM_GUARD_NAME(__LINE__) = sfm::impl::makeScopeGuard<true >([&]{ X; });

#endif //SCOPE_GUARD_H_5107348232916450
