#pragma once

#include <string>
#include <string_view>

#include <xgx/error/code.hpp>
#include <xgx/error/context.hpp>
#include <xgx/error/error_node.hpp>
#include <xgx/error/error_value.hpp>
#include <xgx/error/stack.hpp>

namespace xgx::detail
{

struct error_state
{
    std::string message;
    code classification;
    context fields;
    error cause;
    stack_trace stack;
};

auto make_failure(error_state state) -> fault;
// the classification is fixed, a null cause is replaced by a "nil defect"
auto make_defect(error_state state) -> fault;
// the classification is fixed and the stack is discarded
auto make_interrupt(error_state state) -> fault;

// the internal failure with an empty message which null faults operate on
auto blank_failure() noexcept -> error_value const &;

// renders the null error as <nil>
void format_verbose(error_node::format_buffer &out, error const &e);
void format_verbose(error_node::format_buffer &out,
                    code const &classification,
                    std::string_view msg,
                    context const &fields,
                    error const &cause,
                    stack_trace const &stack);

} // namespace xgx::detail
