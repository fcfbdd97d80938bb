#include "assert.hh"

#include <ordered-core/assert-handler.hh>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#ifdef OC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
// NOTE: not thread-safe, pushing and popping must be externally synchronized
std::vector<oc::impl::assertion_handler>& assertion_handlers()
{
    static std::vector<oc::impl::assertion_handler> handlers;
    return handlers;
}

// one report per failure, e.g.
//   [ordered-core] assertion failed at src/x.cc:12:5 in void f()
//     condition: c.is_valid()
//     message:   cursor does not point at a live entry
void write_report(oc::impl::assertion_info const& info)
{
    std::cerr << "[ordered-core] assertion failed at " << info.location.file_name() << ':' << info.location.line()
              << ':' << info.location.column() << " in " << info.location.function_name() << '\n'
              << "  condition: " << info.expression << '\n'
              << "  message:   " << info.message << std::endl;
}
} // namespace

void oc::impl::push_assertion_handler(assertion_handler handler)
{
    assertion_handlers().push_back(std::move(handler));
}

void oc::impl::pop_assertion_handler()
{
    auto& handlers = assertion_handlers();
    if (!handlers.empty())
        handlers.pop_back();
}

oc::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

oc::impl::scoped_assertion_handler::~scoped_assertion_handler() { pop_assertion_handler(); }

void oc::impl::handle_assert_failure(char const* expression, char const* message, oc::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    // handlers may throw; the caller aborts only if they return
    if (auto& handlers = assertion_handlers(); !handlers.empty())
        handlers.back()(info);
    else
        write_report(info);
}

bool oc::impl::is_debugger_connected() noexcept
{
#ifdef OC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(OC_OS_LINUX)
    // a traced process reports the tracer's pid, 0 otherwise
    auto status = std::ifstream("/proc/self/status");
    std::string line;
    while (std::getline(status, line))
        if (line.starts_with("TracerPid:"))
            return std::atoi(line.c_str() + 10) != 0;
    return false;
#else
    return false;
#endif
}

void oc::impl::perform_abort() noexcept { std::abort(); }
