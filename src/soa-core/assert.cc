#include "assert.hh"

#include <soa-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <utility>
#include <vector>

#ifdef SOA_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
using handler_fn = std::move_only_function<void(soa::impl::assertion_info const&)>;

// topmost entry handles the next failure
// NOTE: global and unsynchronized, tests and tools install handlers from one thread
std::vector<handler_fn> g_assertion_handlers;

void print_to_stderr(soa::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << "[soa-core] assertion `" << info.expression << "` failed\n"
              << "  " << info.message << '\n'
              << "  at " << loc.file_name() << ':' << loc.line() << ':' << loc.column() << " in " << loc.function_name() << '\n';
    std::cerr.flush();
}

#ifdef SOA_OS_LINUX
// pid of the tracing process from /proc/self/status, 0 if none or unreadable
int tracer_pid()
{
    auto* status = std::fopen("/proc/self/status", "r");
    if (status == nullptr)
        return 0;

    int pid = 0;
    char line[256];
    while (std::fgets(line, sizeof(line), status) != nullptr)
        if (std::sscanf(line, "TracerPid: %d", &pid) == 1)
            break;

    std::fclose(status);
    return pid;
}
#endif
} // namespace

void soa::impl::push_assertion_handler(handler_fn handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void soa::impl::pop_assertion_handler()
{
    if (g_assertion_handlers.empty())
        return;
    g_assertion_handlers.pop_back();
}

soa::impl::scoped_assertion_handler::scoped_assertion_handler(handler_fn handler)
{
    push_assertion_handler(std::move(handler));
}

soa::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

SOA_COLD_FUNC void soa::impl::handle_assert_failure(char const* expression, char const* message, soa::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    // handlers may throw to unwind, otherwise the caller breaks and aborts
    if (g_assertion_handlers.empty())
        print_to_stderr(info);
    else
        g_assertion_handlers.back()(info);
}

bool soa::impl::is_debugger_connected() noexcept
{
#if defined(SOA_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(SOA_OS_LINUX)
    return tracer_pid() != 0;
#else
    return false;
#endif
}

[[noreturn]] void soa::impl::perform_abort() noexcept
{
    std::abort();
}
