#pragma once

#include <ring-core/source_location.hh>

#include <functional>
#include <string>

namespace rc::impl
{
// Customizable assertion handler stack
// NOTE: handlers are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = rc::impl::scoped_assertion_handler([](rc::impl::assertion_info const& info) {
//           log_to_crash_reporter(info);
//           throw ring_corrupted{info.message};
//       });
//
//       auto v = ring[i]; // a failed RC_ASSERT in here unwinds instead of aborting
//   }

struct assertion_info
{
    std::string expression;
    std::string message;
    rc::source_location location;
};

// Push a handler that receives every assertion failure until it is popped
// Handlers may throw to unwind to a recovery point instead of aborting
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost handler (no-op on an empty stack)
void pop_assertion_handler();

// RAII push/pop, also pops when a throwing handler unwinds through its scope
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};

// Number of currently installed handlers
[[nodiscard]] int assertion_handler_count();
} // namespace rc::impl
