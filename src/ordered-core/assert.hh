#pragma once

// Included by every container header, keep it light.
#include <ordered-core/macros.hh>
#include <ordered-core/source_location.hh>

// =========================================================================================================
// Assertions
// =========================================================================================================
//
// OC_ASSERT(cond, "message")
//   Checked when OC_ASSERT_ENABLED is 1 (Debug and RelWithDebInfo; Release only with
//   OC_ENABLE_ASSERT_IN_RELEASE). When disabled, cond is type-checked but not evaluated.
//
// OC_ASSERT_ALWAYS(cond, "message")
//   Checked in every build. For conditions whose failure would corrupt the arena
//   and for debug_check_invariants().
//
// On failure the report goes to the topmost handler (assert-handler.hh) or to stderr,
// then an attached debugger breaks and the process aborts. A throwing handler skips the abort.
//
// Used for programmer errors only:
//   - reading or advancing a cursor whose entry is gone / that is at the end
//   - value() on an empty oc::optional
//   - broken index / sequence / free-list invariants
// A missing key is NOT an error: get / remove / pop answer with optional, nullptr or false.
// Exceptions only come from V itself or from allocation.
//
// Usage:
//   OC_ASSERT(c.is_valid(), "cursor does not point at a live entry");

#define OC_ASSERT_ALWAYS(cond, msg)                                                         \
    do                                                                                      \
    {                                                                                       \
        if (!(cond)) [[unlikely]]                                                           \
        {                                                                                   \
            ::oc::impl::handle_assert_failure(#cond, msg, ::oc::source_location::current()); \
            OC_BREAK_AND_ABORT();                                                           \
        }                                                                                   \
    } while (false)

#if OC_ASSERT_ENABLED
#define OC_ASSERT(cond, msg) OC_ASSERT_ALWAYS(cond, msg)
#else
#define OC_ASSERT(cond, msg) \
    do                       \
    {                        \
        OC_UNUSED(cond);     \
        OC_UNUSED(msg);      \
    } while (false)
#endif

// breaks into an attached debugger, no-op otherwise
// a macro so the debugger stops at the failing line, not inside a helper
#if defined(OC_COMPILER_MSVC)
#define OC_DEBUG_BREAK() (::oc::impl::is_debugger_connected() ? __debugbreak() : void(0))
#else
// 5 == SIGTRAP; declared by hand to keep <csignal> out of every header
extern "C" int raise(int) noexcept;
#define OC_DEBUG_BREAK() (::oc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#endif

#define OC_BREAK_AND_ABORT() (OC_DEBUG_BREAK(), ::oc::impl::perform_abort())

namespace oc::impl
{
// reports to the handler stack or stderr; does not abort (the macro does)
OC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, oc::source_location location);

bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace oc::impl
