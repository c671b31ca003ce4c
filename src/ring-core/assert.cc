#include "assert.hh"

#include <ring-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>

#ifdef RC_HAS_STACKTRACE
#include <stacktrace>
#endif

#ifdef RC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef RC_COMPILER_POSIX
#include <unistd.h>

#include <cstring>
#endif

namespace
{
// NOTE: not thread-safe, must be externally synchronized
std::vector<std::move_only_function<void(rc::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(rc::impl::assertion_info const& info)
{
    std::cerr << "Assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";

#ifdef RC_HAS_STACKTRACE
    std::cerr << "\nStacktrace:\n";
    std::cerr << std::to_string(std::stacktrace::current(1)) << '\n';
#endif

    std::cerr.flush();
}
} // namespace

void rc::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void rc::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

int rc::impl::assertion_handler_count()
{
    return int(g_assertion_handlers.size());
}

rc::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

rc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

RC_COLD_FUNC void rc::impl::handle_assert_failure(char const* expression, char const* message, rc::source_location location)
{
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, RC_BREAK_AND_ABORT follows at the call site
}

bool rc::impl::is_debugger_connected() noexcept
{
#ifdef RC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(RC_OS_LINUX)
    // a non-zero TracerPid in /proc/self/status means we are being traced
    auto* f = std::fopen("/proc/self/status", "r");
    if (!f)
        return false;

    int pid = 0;
    char buf[1024];
    while (std::fgets(buf, sizeof(buf), f))
    {
        if (std::strncmp(buf, "TracerPid:", 10) == 0)
        {
            if (std::sscanf(buf + 10, "%d", &pid) != 1)
                pid = 0;
            break;
        }
    }
    std::fclose(f);
    return pid != 0;
#else
    return false;
#endif
}

[[noreturn]] void rc::impl::perform_abort() noexcept
{
    std::abort();
}
