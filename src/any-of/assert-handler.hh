#pragma once

#include <any-of/assert.hh>

#include <cstddef>
#include <functional>
#include <string>

namespace ao::impl
{
// Handler stack for failed AO_ASSERT / AO_ASSERT_ALWAYS / AO_PANIC
//
// Every failed extraction (unwrap_*, expect_*, into_both, into_either, from_opt2 on the wrong shape)
// ends up here. The topmost handler sees the failure first; without handlers the failure is
// printed to stderr. Afterwards the process breaks into an attached debugger and aborts,
// unless the handler throws.
// NOTE: the stack is global and must be externally synchronized
//
// Usage:
//   {
//       auto handler = ao::impl::scoped_assertion_handler([](ao::impl::assertion_info const& info) {
//           throw config_error{info.message};
//       });
//       auto port = settings.expect_left("config must name a port"); // throws instead of aborting
//   } // popped here

struct assertion_info
{
    std::string expression; // stringified condition, "panic" for AO_PANIC
    std::string message;
    ao::source_location location;

    [[nodiscard]] bool is_panic() const { return expression == "panic"; }
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

// "file:line:col: assertion `expr` failed: message" or "file:line:col: panic: message"
// used by the default handler, available for custom handlers that log
[[nodiscard]] std::string format_assertion_info(assertion_info const& info);

void push_assertion_handler(assertion_handler handler);

// no-op on an empty stack
void pop_assertion_handler();

[[nodiscard]] std::size_t assertion_handler_depth();

// pushes on construction, pops on destruction
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace ao::impl
