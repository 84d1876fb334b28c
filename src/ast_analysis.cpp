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


#include "alembic/ast/analysis.hpp"
#include "alembic/printer/operators.hpp"


namespace alm::ast {

std::optional<std::string_view>
var_name(node_ptr x) noexcept
{
  if (const var_node *v = x->get<var_node>())
    return std::string_view {v->name};
  return std::nullopt;
}

std::optional<std::string_view>
bound_name(node_ptr x) noexcept
{
  if (const match_node *m = x->get<match_node>())
  {
    if (const var_pattern *v = m->pattern->get<var_pattern>())
      return std::string_view {v->name};
  }
  return std::nullopt;
}

bool
is_literal(node_ptr x) noexcept
{
  return x->is<literal_node>() or x->is<atom_node>() or x->is<nil_node>();
}


static void
_count_pattern_reads(pattern_ptr p, std::string_view name, size_t &count)
{
  if (const pin_pattern *pin = p->get<pin_pattern>())
  {
    if (pin->name == name)
      count += 1;
  }
  for_each_subpattern(p, [&](pattern_ptr q) {
    _count_pattern_reads(q, name, count);
  });
}

size_t
count_reads(node_ptr x, std::string_view name)
{
  size_t count = 0;
  std::function<void(node_ptr)> count_in = [&](node_ptr y) {
    if (is_var(y, name))
      count += 1;
    for_each_child(y,
      [&](node_ptr child, child_role) { count_in(child); },
      [&](pattern_ptr p) { _count_pattern_reads(p, name, count); });
  };
  count_in(x);
  return count;
}


static bool
_pattern_binds(pattern_ptr p, std::string_view name)
{
  for (const stl::string &var : pattern_variables(p))
  {
    if (var == name)
      return true;
  }
  return false;
}

bool
binds(node_ptr x, std::string_view name)
{
  bool found = false;
  walk(x, [&](node_ptr y) {
    for_each_child(y, [](node_ptr, child_role) { }, [&](pattern_ptr p) {
      found = found or _pattern_binds(p, name);
    });
    return not found;
  });
  return found;
}

bool
contains_assignment(node_ptr x)
{
  bool found = false;
  walk(x, [&](node_ptr y) {
    if (y->is<match_node>() or y->is<assign_node>())
      found = true;
    return not found;
  });
  return found;
}

bool
is_pure(node_ptr x)
{
  if (x->is<var_node>() or x->is<alias_node>() or is_literal(x))
    return true;
  if (const field_node *f = x->get<field_node>())
    return is_pure(f->object);
  if (const paren_node *p = x->get<paren_node>())
    return is_pure(p->inner);
  if (const unary_node *u = x->get<unary_node>())
  {
    return (u->op == unary_op::negate or u->op == unary_op::not_) and
           is_pure(u->operand);
  }
  if (const binary_node *b = x->get<binary_node>())
    return b->op != binary_op::pipe and is_pure(b->lhs) and is_pure(b->rhs);
  if (x->is<list_node>() or x->is<tuple_node>() or x->is<map_node>() or
      x->is<keyword_node>() or x->is<struct_node>())
  {
    bool pure = true;
    for_each_child(x, [&](node_ptr child, child_role) {
      pure = pure and is_pure(child);
    });
    return pure;
  }
  return false;
}

bool
uses_bitwise(node_ptr x)
{
  bool found = false;
  walk(x, [&](node_ptr y) {
    if (const binary_node *b = y->get<binary_node>())
      found = found or is_bitwise(b->op);
    if (const unary_node *u = y->get<unary_node>())
      found = found or u->op == unary_op::bnot;
    return not found;
  });
  return found;
}


node_list
statements_of(node_ptr x)
{
  if (const block_node *b = x->get<block_node>())
    return b->statements;
  return node_list {x};
}

node_ptr
make_sequence(node_list statements, node_ptr origin)
{
  if (statements.size() == 1)
    return statements.front();
  return make_node(block_node {std::move(statements)},
                   origin ? origin->meta : nullptr);
}


node_ptr
substitute(node_ptr x, std::string_view name, node_ptr replacement)
{
  return rewrite(x, [&](node_ptr y) {
    return is_var(y, name) ? replacement : y;
  });
}

node_ptr
substitute_first(node_ptr x, std::string_view name, node_ptr first,
                 node_ptr rest)
{
  bool done = false;
  std::function<node_ptr(node_ptr)> subst = [&](node_ptr y) -> node_ptr {
    if (is_var(y, name))
    {
      if (done)
        return rest;
      done = true;
      return first;
    }
    if (y->is<raw_node>())
      return y;
    return rebuild(y, [&](node_ptr child, child_role) { return subst(child); });
  };
  return subst(x);
}


pattern_ptr
rename(pattern_ptr p, std::string_view from, std::string_view to)
{
  return rewrite_pattern(p, [&](pattern_ptr q) -> pattern_ptr {
    if (const var_pattern *v = q->get<var_pattern>(); v and v->name == from)
      return make_pattern(var_pattern {stl::string {to}, v->source_id});
    if (const pin_pattern *pin = q->get<pin_pattern>(); pin and pin->name == from)
      return make_pattern(pin_pattern {stl::string {to}});
    return q;
  });
}

node_ptr
rename(node_ptr x, std::string_view from, std::string_view to)
{
  if (x->is<raw_node>())
    return x;
  if (is_var(x, from))
    return make_node(var_node {stl::string {to}}, x->meta);
  return rebuild(x,
    [&](node_ptr child, child_role) { return rename(child, from, to); },
    [&](pattern_ptr p) { return rename(p, from, to); });
}


node_ptr
map_definitions(node_ptr root, const std::function<node_ptr(node_ptr)> &fn)
{
  bool has_defs = false;
  walk(root, [&](node_ptr x) {
    has_defs = has_defs or x->is<def_node>();
    return not has_defs;
  });
  if (not has_defs)
    return fn(root);

  return rewrite(root, [&](node_ptr x) {
    return x->is<def_node>() ? fn(x) : x;
  });
}

} // namespace alm::ast
