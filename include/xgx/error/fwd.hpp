#pragma once

#include <cstddef>
#include <cstdint>

namespace xgx
{

class code;
class context;
class stack_trace;
class error;
class error_node;
class error_value;
class fault;
class joined_error;
class error_exception;

struct field;
struct stack_frame;

// the closed set of native error variants
enum class error_kind
{
    failure,
    defect,
    interrupt,
};

// how the traversal engine recognizes an already visited node
enum class node_identity
{
    // keyed by the node address
    reference,
    // keyed by error_node::hash_value() / error_node::equals()
    value,
    // can't be proven cyclic, always treated as novel
    transient,
};

enum class error_message_format
{
    simple,
    with_diagnostics,
};

enum class code_search
{
    primary_path,
    full_graph,
};

// maximum number of frames recorded by a stack capture
constexpr std::size_t default_stack_depth = 64;

// hard limits which guarantee termination of graph traversals
constexpr std::size_t max_traversal_depth = 4096;
constexpr std::size_t max_traversal_nodes = 65536;

namespace detail
{
constexpr std::size_t error_format_stack_buffer_size = 1024;
}

} // namespace xgx
