#include "assert.hh"

#include <any-of/assert-handler.hh>

#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#ifdef AO_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
// function-local so that handlers can be pushed from static initializers
std::vector<ao::impl::assertion_handler>& handler_stack()
{
    static std::vector<ao::impl::assertion_handler> handlers;
    return handlers;
}

#ifdef AO_OS_LINUX
// "TracerPid:\t<pid>" in /proc/self/status, 0 without a tracer
int read_tracer_pid()
{
    auto status = std::ifstream("/proc/self/status");
    auto line = std::string();
    while (std::getline(status, line))
    {
        if (!line.starts_with("TracerPid:"))
            continue;

        auto pid = 0;
        for (auto c : std::string_view(line).substr(10))
            if (c >= '0' && c <= '9')
                pid = pid * 10 + (c - '0');
        return pid;
    }
    return 0;
}
#endif
} // namespace

std::string ao::impl::format_assertion_info(assertion_info const& info)
{
    auto s = std::string(info.location.file_name());
    s += ':';
    s += std::to_string(info.location.line());
    s += ':';
    s += std::to_string(info.location.column());

    if (info.is_panic())
        s += ": panic";
    else
    {
        s += ": assertion `";
        s += info.expression;
        s += "` failed";
    }

    if (!info.message.empty())
    {
        s += ": ";
        s += info.message;
    }

    s += " (in ";
    s += info.location.function_name();
    s += ')';
    return s;
}

void ao::impl::push_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

void ao::impl::pop_assertion_handler()
{
    auto& handlers = handler_stack();
    if (!handlers.empty())
        handlers.pop_back();
}

std::size_t ao::impl::assertion_handler_depth()
{
    return handler_stack().size();
}

ao::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

ao::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

AO_COLD_FUNC void ao::impl::handle_assert_failure(char const* expression, char const* message, ao::source_location location)
{
    auto const info = assertion_info{
        .expression = expression ? expression : "",
        .message = message ? message : "",
        .location = location,
    };

    auto& handlers = handler_stack();
    if (handlers.empty())
    {
        std::cerr << format_assertion_info(info) << std::endl;
        return;
    }

    // may throw, the caller aborts otherwise
    handlers.back()(info);
}

bool ao::impl::is_debugger_connected() noexcept
{
#if defined(AO_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(AO_OS_LINUX)
    try
    {
        return read_tracer_pid() != 0;
    }
    catch (std::exception const&)
    {
        return false;
    }
#else
    return false;
#endif
}

[[noreturn]] void ao::impl::perform_abort() noexcept
{
    std::abort();
}
