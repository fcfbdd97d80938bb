#pragma once

#include <ordered-core/macros.hh>
#include <ordered-core/source_location.hh>

#include <functional>
#include <string>

// Replaceable reaction to OC_ASSERT / OC_ASSERT_ALWAYS failures.
//
// Handlers form a stack; a failure is reported to the topmost one only.
// With an empty stack the report goes to stderr and the process aborts.
// A handler that throws unwinds out of the failing container call instead
// (tests use this to observe cursor misuse without dying).
//
// NOTE: the stack is process-global and not synchronized
//
// Usage:
//   {
//       auto guard = oc::impl::scoped_assertion_handler([](oc::impl::assertion_info const& info) {
//           throw cursor_misuse{info.message};
//       });
//       prune_while_iterating(map);
//   }

namespace oc::impl
{
/// What a failed assertion reports.
struct assertion_info
{
    std::string expression; ///< stringified condition
    std::string message;
    oc::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

void push_assertion_handler(assertion_handler handler);

/// Pops the topmost handler; no-op on an empty stack.
void pop_assertion_handler();

/// Pushes on construction, pops on destruction (also while a handler's exception unwinds).
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace oc::impl
