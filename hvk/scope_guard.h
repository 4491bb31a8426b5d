// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_8971632487321434
#define SCOPE_GUARD_H_8971632487321434

#include <cassert>
#include <exception>
#include <type_traits>
#include <utility>


namespace hvk
{
/*  run cleanup when leaving a scope:

        HVK_ON_SCOPE_EXIT(::curl_easy_cleanup(easyHandle));
        HVK_ON_SCOPE_FAIL(removeFilePlain(tempFilePath));   //only while unwinding due to an exception

    named guard when the cleanup may become obsolete:

        auto guardSession = makeGuard<ScopeGuardRunMode::onFail>([&] { pool.discard(std::move(session)); });
            ...
        guardSession.dismiss();                                        */

enum class ScopeGuardRunMode
{
    onExit,
    onFail,
};


template <ScopeGuardRunMode runMode, class F>
class ScopeGuard
{
public:
    explicit ScopeGuard(F&& fun) : fun_(std::move(fun)) {}

    ScopeGuard(ScopeGuard&& tmp) : fun_(std::move(tmp.fun_)), uncaughtBefore_(tmp.uncaughtBefore_), active_(std::exchange(tmp.active_, false)) {}

    ~ScopeGuard() noexcept(runMode == ScopeGuardRunMode::onFail)
    {
        if (!active_)
            return;

        const bool unwinding = std::uncaught_exceptions() > uncaughtBefore_;

        if (runMode == ScopeGuardRunMode::onFail && !unwinding)
            return;

        if (!unwinding)
            fun_(); //throw X
        else
            try { fun_(); }
            catch (...) { assert(false); } //an exception is already in flight: no one left to report to
    }

    void dismiss() { active_ = false; }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    F fun_;
    const int uncaughtBefore_ = std::uncaught_exceptions();
    bool active_ = true;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::decay_t<F>(std::forward<F>(fun))); }
}

#define HVK_CONCAT_SUB(X, Y) X ## Y
#define HVK_CONCAT(X, Y) HVK_CONCAT_SUB(X, Y)

#define HVK_ON_SCOPE_EXIT(X) [[maybe_unused]] auto HVK_CONCAT(scopeGuard, __LINE__) = hvk::makeGuard<hvk::ScopeGuardRunMode::onExit>([&]{ X; });
#define HVK_ON_SCOPE_FAIL(X) [[maybe_unused]] auto HVK_CONCAT(scopeGuard, __LINE__) = hvk::makeGuard<hvk::ScopeGuardRunMode::onFail>([&]{ X; });

//map a named constant to its wide string name inside a switch
#define HVK_CHECK_CASE_FOR_CONSTANT(X) case X: return HVK_CONCAT(L, #X)

#endif //SCOPE_GUARD_H_8971632487321434
