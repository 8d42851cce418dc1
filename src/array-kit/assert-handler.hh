#pragma once

#include <array-kit/assert.hh>

#include <functional>
#include <string>

namespace ak::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = ak::impl::scoped_assertion_handler([](ak::impl::assertion_info const& info) {
//           report(info);
//           throw precondition_violation{info.message};
//       });
//
//       // Any AK_ASSERT failing in this scope reaches the handler above
//       auto x = arr[idx];
//   } // handler is automatically popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    ak::source_location location;
};

// Push a custom assertion handler onto the handler stack
// Handlers may throw to unwind to a recovery point instead of aborting
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// A pop on an empty stack is a no-op
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace ak::impl
