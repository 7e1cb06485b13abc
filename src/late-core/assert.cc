#include "assert.hh"

#include <late-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>
#include <version>

#ifdef __cpp_lib_stacktrace
#include <stacktrace>
#endif

namespace
{
using handler_t = std::move_only_function<void(lc::impl::assertion_info const&)>;

// last element is the active handler
std::vector<handler_t> g_handlers;

void report_to_stderr(lc::impl::assertion_info const& info)
{
    std::cerr << "late-core contract violation: " << info.message << '\n';
    std::cerr << "  check: " << info.expression << '\n';
    std::cerr << "  at " << info.location.file_name() << ':' << info.location.line() << " in "
              << info.location.function_name() << '\n';

#ifdef __cpp_lib_stacktrace
    std::cerr << std::to_string(std::stacktrace::current(1)) << '\n';
#endif
}
} // namespace

void lc::impl::push_assertion_handler(handler_t handler)
{
    g_handlers.push_back(std::move(handler));
}

void lc::impl::pop_assertion_handler()
{
    if (!g_handlers.empty())
        g_handlers.pop_back();
}

lc::impl::scoped_assertion_handler::scoped_assertion_handler(handler_t handler)
{
    push_assertion_handler(std::move(handler));
}

lc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

LC_COLD_FUNC void lc::impl::handle_assert_failure(char const* expression, char const* message, lc::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (g_handlers.empty())
        report_to_stderr(info);
    else
        g_handlers.back()(info);
}

bool lc::impl::is_debugger_connected() noexcept
{
#ifdef LC_OS_LINUX
    // a traced process has a non-zero TracerPid
    auto* status = std::fopen("/proc/self/status", "r");
    if (!status)
        return false;

    int tracer = 0;
    char line[256];
    while (std::fgets(line, sizeof(line), status))
        if (std::sscanf(line, "TracerPid: %d", &tracer) == 1)
            break;

    std::fclose(status);
    return tracer != 0;
#else
    return false;
#endif
}

[[noreturn]] void lc::impl::perform_abort() noexcept
{
    std::abort();
}
