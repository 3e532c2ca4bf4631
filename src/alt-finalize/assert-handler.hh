#pragma once

#include <alt-finalize/macros.hh>
#include <alt-finalize/source_location.hh>

#include <functional>
#include <string>

namespace af::impl
{
// Replaceable reaction to failed assertions
// NOTE: the handler stack is global state and must be externally synchronized
//
// Tests use a throwing handler to observe precondition violations without aborting:
//   auto handler = af::impl::scoped_assertion_handler([](af::impl::assertion_info const& info) {
//       throw assertion_failure{info.message};
//   });
//   auto v = af::move(guard).extract(); // second extract -> throws instead of aborting

struct assertion_info
{
    std::string expression;
    std::string message;
    af::source_location location;
};

// Handlers may throw to unwind to a recovery point
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// No-op if the stack is empty
void pop_assertion_handler();

// Pushes on construction, pops on destruction
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace af::impl
