/*
 * Alembic - Lowering typed object trees into Elixir source
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include "alembic/ast/node.hpp"

#include <string_view>

/**
 * \file operators.hpp
 * Operator tokens and precedence of the target grammar
 *
 * \ingroup printer
 */


namespace alm {

/**
 * Token of an infix operator, or the function name for operators printed as
 * calls
 */
constexpr std::string_view
operator_token(ast::binary_op op) noexcept
{
  using enum ast::binary_op;
  switch (op)
  {
    case add: return "+";
    case sub: return "-";
    case mul: return "*";
    case div: return "/";
    case int_div: return "div";
    case rem: return "rem";
    case eq: return "==";
    case neq: return "!=";
    case strict_eq: return "===";
    case strict_neq: return "!==";
    case lt: return "<";
    case le: return "<=";
    case gt: return ">";
    case ge: return ">=";
    case and_: return "&&";
    case or_: return "||";
    case concat: return "<>";
    case list_concat: return "++";
    case list_subtract: return "--";
    case pipe: return "|>";
    case in: return "in";
    case band: return "band";
    case bor: return "bor";
    case bxor: return "bxor";
    case bsl: return "bsl";
    case bsr: return "bsr";
  }
  return "?";
}

constexpr std::string_view
operator_token(ast::unary_op op) noexcept
{
  using enum ast::unary_op;
  switch (op)
  {
    case negate: return "-";
    case not_: return "!";
    case bnot: return "bnot";
    case pre_increment: case post_increment: return "++";
    case pre_decrement: case post_decrement: return "--";
  }
  return "?";
}

constexpr bool
is_bitwise(ast::binary_op op) noexcept
{
  using enum ast::binary_op;
  return op == band or op == bor or op == bxor or op == bsl or op == bsr;
}

/**
 * Operators the target grammar has no infix syntax for
 *
 * They print as `rem(a, b)`, `div(a, b)` or `Bitwise.band(a, b)`.
 */
constexpr bool
prints_as_call(ast::binary_op op) noexcept
{
  using enum ast::binary_op;
  return is_bitwise(op) or op == rem or op == int_div;
}

/**
 * Binding strength of an infix operator; greater binds tighter
 */
constexpr int
precedence(ast::binary_op op) noexcept
{
  using enum ast::binary_op;
  switch (op)
  {
    case mul: case div:
      return 9;
    case add: case sub:
      return 8;
    case concat: case list_concat: case list_subtract:
      return 7;
    case in:
      return 6;
    case pipe:
      return 5;
    case lt: case le: case gt: case ge:
      return 4;
    case eq: case neq: case strict_eq: case strict_neq:
      return 3;
    case and_:
      return 2;
    case or_:
      return 1;
    case int_div: case rem:
    case band: case bor: case bxor: case bsl: case bsr:
      return 100;
  }
  return 0;
}

/** Precedence of the range operator `..` */
constexpr int range_precedence = 7;

constexpr bool
is_right_associative(ast::binary_op op) noexcept
{
  using enum ast::binary_op;
  return op == concat or op == list_concat or op == list_subtract;
}

} // namespace alm
