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
 * \file construct.hpp
 * Shorthands for building nodes and patterns
 *
 * \ingroup ast
 */


namespace alm::ast {

/**
 * \name Leaves
 * \{
 */

inline node_ptr
var(std::string_view name)
{ return make_node(var_node {stl::string {name}}); }

/** Variable read that remembers the front-end binding it refers to */
inline node_ptr
var(std::string_view name, long source_id)
{
  metadata *meta = make<metadata>();
  meta->source_id = source_id;
  return make_node(var_node {stl::string {name}}, meta);
}

inline node_ptr
int_lit(int64_t x)
{ return make_node(literal_node {x}); }

inline node_ptr
float_lit(double x)
{ return make_node(literal_node {x}); }

inline node_ptr
str_lit(std::string_view x)
{ return make_node(literal_node {stl::string {x}}); }

inline node_ptr
bool_lit(bool x)
{ return make_node(literal_node {x}); }

inline node_ptr
atom(std::string_view name)
{ return make_node(atom_node {stl::string {name}}); }

inline node_ptr
nil_lit()
{ return make_node(nil_node { }); }

inline node_ptr
underscore()
{ return make_node(underscore_node { }); }

inline node_ptr
alias(std::string_view name)
{ return make_node(alias_node {stl::string {name}}); }

inline node_ptr
raw(std::string_view code)
{ return make_node(raw_node {stl::string {code}}); }

/** \} */


/**
 * \name Expressions
 * \{
 */

inline node_ptr
call(std::string_view name, node_list args = {})
{ return make_node(call_node {stl::string {name}, std::move(args)}); }

inline node_ptr
remote(node_ptr target, std::string_view name, node_list args = {})
{ return make_node(remote_call_node {target, stl::string {name}, std::move(args)}); }

/** `Module.name(args)` */
inline node_ptr
remote(std::string_view module, std::string_view name, node_list args = {})
{ return remote(alias(module), name, std::move(args)); }

inline node_ptr
apply(node_ptr fun, node_list args = {})
{ return make_node(apply_node {fun, std::move(args)}); }

inline node_ptr
binary(binary_op op, node_ptr lhs, node_ptr rhs)
{ return make_node(binary_node {op, lhs, rhs}); }

inline node_ptr
unary(unary_op op, node_ptr operand)
{ return make_node(unary_node {op, operand}); }

inline node_ptr
field(node_ptr object, std::string_view name)
{ return make_node(field_node {object, stl::string {name}}); }

inline node_ptr
access(node_ptr object, node_ptr key)
{ return make_node(access_node {object, key}); }

inline node_ptr
paren(node_ptr inner)
{ return make_node(paren_node {inner}); }

inline node_ptr
block(node_list statements)
{ return make_node(block_node {std::move(statements)}); }

inline node_ptr
if_(node_ptr condition, node_ptr then_branch, node_ptr else_branch = nullptr)
{ return make_node(if_node {condition, then_branch, else_branch}); }

inline node_ptr
range(node_ptr first, node_ptr last, node_ptr step = nullptr)
{ return make_node(range_node {first, last, step}); }

/** \} */


/**
 * \name Data literals
 * \{
 */

inline node_ptr
list_of(node_list elements, node_ptr tail = nullptr)
{ return make_node(list_node {std::move(elements), tail}); }

inline node_ptr
tuple_of(node_list elements)
{ return make_node(tuple_node {std::move(elements)}); }

/** `%{base | field: value}` */
inline node_ptr
map_update(node_ptr base, std::string_view field, node_ptr value)
{
  map_node map {base, { }};
  map.entries.emplace_back(atom(field), value);
  return make_node(std::move(map));
}

/** \} */


/**
 * \name Patterns
 * \{
 */

inline pattern_ptr
pvar(std::string_view name)
{ return make_pattern(var_pattern {stl::string {name}, std::nullopt}); }

inline pattern_ptr
pwild()
{ return make_pattern(wildcard_pattern { }); }

inline pattern_ptr
plit(node_ptr literal)
{ return make_pattern(literal_pattern {literal}); }

inline pattern_ptr
ptuple(pattern_list elements)
{ return make_pattern(tuple_pattern {std::move(elements)}); }

inline pattern_ptr
plist(pattern_list elements)
{ return make_pattern(list_pattern {std::move(elements)}); }

inline pattern_ptr
pcons(pattern_list heads, pattern_ptr tail)
{ return make_pattern(cons_pattern {std::move(heads), tail}); }

inline pattern_ptr
ppin(std::string_view name)
{ return make_pattern(pin_pattern {stl::string {name}}); }

/** \} */


/**
 * \name Bindings
 * \{
 */

inline node_ptr
bind(pattern_ptr pattern, node_ptr value)
{ return make_node(match_node {pattern, value}); }

/** `name = value` */
inline node_ptr
bind(std::string_view name, node_ptr value)
{ return bind(pvar(name), value); }

inline node_ptr
assign(node_ptr target, node_ptr value)
{ return make_node(assign_node {target, value}); }

/** Single-clause anonymous function */
inline node_ptr
lambda(pattern_list params, node_ptr body)
{
  fn_node fn;
  fn.clauses.push_back({std::move(params), nullptr, body});
  return make_node(std::move(fn));
}

/** \} */

} // namespace alm::ast
