#pragma once

#include <xgx/error/fwd.hpp>

#include <xgx/error/code.hpp>
#include <xgx/error/construct.hpp>
#include <xgx/error/context.hpp>
#include <xgx/error/error_exception.hpp>
#include <xgx/error/error_node.hpp>
#include <xgx/error/error_value.hpp>
#include <xgx/error/foreign.hpp>
#include <xgx/error/format.hpp>
#include <xgx/error/join.hpp>
#include <xgx/error/predicates.hpp>
#include <xgx/error/result.hpp>
#include <xgx/error/stack.hpp>
#include <xgx/error/traverse.hpp>
#include <xgx/error/typed_field.hpp>
#include <xgx/error/wrap.hpp>
