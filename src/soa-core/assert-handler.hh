#pragma once

#include <soa-core/macros.hh>
#include <soa-core/source_location.hh>

#include <functional>
#include <string>

namespace soa::impl
{
// Customizable assertion handler stack
// NOTE: Handlers are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = soa::impl::scoped_assertion_handler([](soa::impl::assertion_info const& info) {
//           log_assertion_failure(info);
//           throw storage_contract_violation{info.message};
//       });
//
//       storage.grow(4, 2, 0); // asserts, handler throws, we unwind out of here
//   } // handler is popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    soa::source_location location;
};

// Push a custom assertion handler onto the handler stack
// Handlers may throw to unwind to a recovery point instead of aborting
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler
// Popping an empty stack is a no-op
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
} // namespace soa::impl
