#pragma once

#include <late-core/macros.hh>
#include <late-core/source_location.hh>

#include <functional>
#include <string>

// Hosted-only: replaceable reporting of failed LC_ASSERT / LC_ASSERT_ALWAYS / LC_ASSERT_UNREACHABLE.
//
// Handlers form a stack, the most recently pushed one receives every report.
// After the handler returns the program aborts, so a handler that wants to continue must throw.
// Tests use this to turn contract violations into exceptions:
//
//   auto guard = lc::impl::scoped_assertion_handler([](lc::impl::assertion_info const& info) { throw info; });
//   cell.initialize(2); // second write, throws instead of aborting
//
// The stack is plain global state, push and pop from one thread only.

namespace lc::impl
{
struct assertion_info
{
    std::string expression;
    std::string message;
    lc::source_location location;
};

void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// no-op on an empty stack
void pop_assertion_handler();

// pops in its destructor, also when the handler threw
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace lc::impl
