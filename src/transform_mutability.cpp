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


#include "alembic/transform/passes.hpp"
#include "alembic/ast/analysis.hpp"
#include "alembic/ast/construct.hpp"
#include "alembic/ast/traversal.hpp"
#include "alembic/printer/printer.hpp"

#include <algorithm>
#include <array>


namespace alm::passes {

using namespace alm::ast;


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                              mutable lowering
static bool
_is_instance_field(node_ptr x) noexcept
{
  const field_node *f = x->get<field_node>();
  return f and is_var(f->object, instance_parameter);
}

static bool
_is_mutable_target(node_ptr x) noexcept
{ return x->is<var_node>() or _is_instance_field(x); }

/**
 * Rebinding that stores \p value into \p target
 *
 * A variable is rebound; a field of the instance parameter becomes a map
 * update of the instance parameter. Other targets have no functional
 * counterpart.
 */
static std::optional<node_ptr>
_store(node_ptr target, node_ptr value)
{
  if (const auto name = var_name(target))
    return bind(*name, value);
  if (_is_instance_field(target))
  {
    const field_node *f = target->get<field_node>();
    return bind(instance_parameter,
                map_update(var(instance_parameter), f->field, value));
  }
  return std::nullopt;
}

static const remote_call_node*
_method_call(node_ptr x, std::string_view name, size_t arity) noexcept
{
  const remote_call_node *c = x->get<remote_call_node>();
  if (c and c->name == name and c->args.size() == arity and
      _is_mutable_target(c->target))
    return c;
  return nullptr;
}

static const unary_node*
_step(node_ptr x) noexcept
{
  const unary_node *u = x->get<unary_node>();
  if (not u or not _is_mutable_target(u->operand))
    return nullptr;
  switch (u->op)
  {
    case unary_op::pre_increment:
    case unary_op::post_increment:
    case unary_op::pre_decrement:
    case unary_op::post_decrement:
      return u;
    default:
      return nullptr;
  }
}

static node_ptr
_apply_step(const unary_node &u)
{
  const bool increment = u.op == unary_op::pre_increment or
                         u.op == unary_op::post_increment;
  const binary_op op = increment ? binary_op::add : binary_op::sub;
  return *_store(u.operand, binary(op, u.operand, int_lit(1)));
}

static node_ptr
_apply_pop(node_ptr target)
{ return *_store(target, remote("List", "delete_at", {target, int_lit(-1)})); }

static bool
_is_prefix(const unary_node &u) noexcept
{ return u.op == unary_op::pre_increment or u.op == unary_op::pre_decrement; }

static bool
_passes_context(node_ptr x) noexcept
{
  return x->is<if_node>() or x->is<case_node>() or x->is<cond_node>() or
         x->is<try_node>() or x->is<receive_node>() or x->is<with_node>();
}

static bool
_is_while(node_ptr x) noexcept
{
  const call_node *c = x->get<call_node>();
  return c and c->name == printer::while_placeholder;
}

/**
 * Statements replacing \p x once its children are lowered
 *
 * If \p discarded is false, the last statement yields the value \p x had.
 */
static node_list
_lower_form(node_ptr x, bool discarded, name_generator &gensym)
{
  if (const remote_call_node *c = _method_call(x, "push", 1))
  {
    const node_ptr appended =
      binary(binary_op::list_concat, c->target, list_of({c->args.front()}));
    const node_ptr store = *_store(c->target, appended);
    if (discarded)
      return {store};
    return {store, call("length", {c->target})};
  }

  if (const remote_call_node *c = _method_call(x, "pop", 0))
  {
    if (discarded)
      return {_apply_pop(c->target)};
    const std::string last = gensym("temp_{}");
    return {bind(last, remote("List", "last", {c->target})),
            _apply_pop(c->target), var(last)};
  }

  if (const unary_node *u = _step(x))
  {
    if (discarded)
      return {_apply_step(*u)};
    if (_is_prefix(*u))
      return {_apply_step(*u), u->operand};
    const std::string previous = gensym("temp_{}");
    return {bind(previous, u->operand), _apply_step(*u), var(previous)};
  }

  if (const assign_node *a = x->get<assign_node>())
  {
    const auto stored = _store(a->target, a->value);
    if (not stored)
      return {x};
    if (discarded or a->target->is<var_node>())
      return {*stored};
    return {*stored, a->target};
  }

  return {x};
}

/**
 * `x = a.pop()` and `x = i++` without a temporary
 */
static std::optional<node_list>
_lower_match(const match_node &m, bool discarded)
{
  node_list result;
  bool binding_last = false;
  if (const remote_call_node *c = _method_call(m.value, "pop", 0))
  {
    result = {bind(m.pattern, remote("List", "last", {c->target})),
              _apply_pop(c->target)};
  }
  else if (const unary_node *u = _step(m.value))
  {
    binding_last = _is_prefix(*u);
    if (binding_last)
      result = {_apply_step(*u), bind(m.pattern, u->operand)};
    else
      result = {bind(m.pattern, u->operand), _apply_step(*u)};
  }
  else
    return std::nullopt;

  if (not discarded and not binding_last)
  {
    const var_pattern *v = m.pattern->get<var_pattern>();
    if (not v)
      return std::nullopt;
    result.push_back(var(v->name));
  }
  return result;
}

/**
 * \p statements as a single node standing where \p origin stood
 */
static node_ptr
_sequence(const node_list &statements, node_ptr origin)
{
  if (statements.size() == 1)
    return inherit_meta(statements.front(), origin);
  return make_node(block_node {statements}, origin->meta);
}

static node_ptr
_lower(node_ptr x, bool discarded, name_generator &gensym)
{
  if (x->is<raw_node>())
    return x;

  if (const block_node *b = x->get<block_node>())
  {
    node_list statements;
    bool changed = false;
    const size_t n = b->statements.size();
    for (size_t i = 0; i < n; ++i)
    {
      const node_ptr stmt = b->statements[i];
      const node_ptr y = _lower(stmt, discarded or i + 1 < n, gensym);
      changed |= y != stmt;
      if (y != stmt and not stmt->is<block_node>() and y->is<block_node>())
      {
        const node_list &spliced = y->get<block_node>()->statements;
        statements.insert(statements.end(), spliced.begin(), spliced.end());
      }
      else
        statements.push_back(y);
    }
    if (not changed)
      return x;
    return make_node(block_node {std::move(statements)}, x->meta);
  }

  if (const match_node *m = x->get<match_node>())
  {
    if (const auto lowered = _lower_match(*m, discarded))
      return _sequence(*lowered, x);
  }

  const bool inherits = _passes_context(x);
  const bool loop = _is_while(x);
  size_t index = 0;
  const node_ptr y = rebuild(x, [&](node_ptr child, child_role role) {
    bool child_discarded = false;
    if (role == child_role::statement)
      child_discarded = true;
    else if (inherits and (role == child_role::body or
                           role == child_role::branch))
      child_discarded = discarded;
    else if (loop and index == 1)
      child_discarded = true;
    ++index;
    return _lower(child, child_discarded, gensym);
  });

  const node_list lowered = _lower_form(y, discarded, gensym);
  if (lowered.size() == 1 and lowered.front() == y)
    return y;
  return _sequence(lowered, y);
}

node_ptr
mutable_lowering(node_ptr root, name_generator &gensym)
{ return _lower(root, true, gensym); }


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                          conditional reassignment
static node_list
_reassign(node_ptr x)
{
  const if_node *n = x->get<if_node>();
  if (not n or n->else_branch)
    return {x};

  const node_list then = statements_of(n->then_branch);
  if (then.size() != 1)
    return {x};

  const auto name = bound_name(then.front());
  if (not name)
    return {x};
  const node_ptr value = then.front()->get<match_node>()->value;
  if (not reads(value, *name))
    return {x};

  const node_ptr branch =
    make_node(if_node {n->condition, value, var(*name)}, x->meta);
  return {bind(*name, branch)};
}

node_ptr
conditional_reassignment(node_ptr root)
{ return expand_statements(root, _reassign); }


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                             redundant nil init
static std::optional<std::string_view>
_nil_init(node_ptr x) noexcept
{
  const auto name = bound_name(x);
  if (name and x->get<match_node>()->value->is<nil_node>())
    return name;
  return std::nullopt;
}

/**
 * Whether the initialization at \p at is overwritten before any read
 */
static bool
_is_overwritten(const node_list &statements, size_t at, std::string_view name)
{
  for (size_t i = at + 1; i < statements.size(); ++i)
  {
    const node_ptr stmt = statements[i];
    if (bound_name(stmt) == name)
    {
      const node_ptr value = stmt->get<match_node>()->value;
      if (value->is<nil_node>())
        continue;
      return not reads(value, name);
    }
    if (reads(stmt, name) or binds(stmt, name))
      return false;
  }
  return false;
}

node_ptr
redundant_nil_init(node_ptr root)
{
  return rewrite(root, [](node_ptr x) -> node_ptr {
    const block_node *b = x->get<block_node>();
    if (not b)
      return x;

    node_list statements;
    for (size_t i = 0; i < b->statements.size(); ++i)
    {
      const node_ptr stmt = b->statements[i];
      const auto name = _nil_init(stmt);
      if (name and _is_overwritten(b->statements, i, *name))
        continue;
      statements.push_back(stmt);
    }

    if (statements.size() == b->statements.size())
      return x;
    return make_node(block_node {std::move(statements)}, x->meta);
  });
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                             statement context
bool
is_functional_update(std::string_view module, std::string_view function)
{
  struct entry { std::string_view module, function; };
  static constexpr std::array<entry, 21> family {{
    {"Map", "put"}, {"Map", "put_new"}, {"Map", "delete"}, {"Map", "merge"},
    {"Map", "update"}, {"Map", "drop"},
    {"List", "insert_at"}, {"List", "delete_at"}, {"List", "replace_at"},
    {"List", "delete"}, {"List", "update_at"},
    {"MapSet", "put"}, {"MapSet", "delete"},
    {"Keyword", "put"}, {"Keyword", "delete"}, {"Keyword", "merge"},
    {"Enum", "reverse"}, {"Enum", "sort"},
    {"String", "replace"},
    {"Map", "update!"}, {"Keyword", "update"},
  }};
  return std::ranges::any_of(family, [&](const entry &e) {
    return e.module == module and e.function == function;
  });
}

static node_ptr
_rebind_discarded(node_ptr x)
{
  const remote_call_node *c = x->get<remote_call_node>();
  if (not c or c->args.empty())
    return x;
  const alias_node *module = c->target->get<alias_node>();
  if (not module or not is_functional_update(module->name, c->name))
    return x;
  const auto name = var_name(c->args.front());
  if (not name)
    return x;
  return bind(*name, x);
}

static node_ptr
_context(node_ptr x, bool discarded)
{
  if (x->is<raw_node>())
    return x;

  if (const block_node *b = x->get<block_node>())
  {
    node_list statements;
    bool changed = false;
    const size_t n = b->statements.size();
    for (size_t i = 0; i < n; ++i)
    {
      const node_ptr stmt = b->statements[i];
      const node_ptr y = _context(stmt, discarded or i + 1 < n);
      changed |= y != stmt;
      statements.push_back(y);
    }
    if (not changed)
      return x;
    return make_node(block_node {std::move(statements)}, x->meta);
  }

  const bool inherits = _passes_context(x);
  const node_ptr y = rebuild(x, [&](node_ptr child, child_role role) {
    bool child_discarded = false;
    if (role == child_role::statement)
      child_discarded = true;
    else if (inherits and (role == child_role::body or
                           role == child_role::branch))
      child_discarded = discarded;
    return _context(child, child_discarded);
  });
  return discarded ? _rebind_discarded(y) : y;
}

node_ptr
statement_context(node_ptr root)
{ return _context(root, true); }

} // namespace alm::passes
