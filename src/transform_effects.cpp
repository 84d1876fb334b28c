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

#include <vector>


namespace alm::passes {

using namespace alm::ast;

static node_ptr
_lift(node_ptr x, node_list &hoisted, name_generator &gensym);

/**
 * Lift the effects out of a slot of a collection literal or a call
 *
 * Matches in list slots are hoisted and their slot is dropped (nullptr is
 * returned). Matches binding a single variable in other slots leave that
 * variable behind. Blocks leave their last statement.
 */
static node_ptr
_lift_slot(node_ptr x, node_list &hoisted, bool droppable,
           name_generator &gensym)
{
  if (const block_node *b = x->get<block_node>())
  {
    if (b->statements.empty())
      return x;
    for (size_t i = 0; i + 1 < b->statements.size(); ++i)
    {
      const node_ptr stmt = _lift(b->statements[i], hoisted, gensym);
      hoisted.push_back(stmt);
    }
    return _lift_slot(b->statements.back(), hoisted, droppable, gensym);
  }

  const node_ptr y = _lift(x, hoisted, gensym);
  if (not y->is<match_node>())
    return y;

  if (droppable)
  {
    hoisted.push_back(y);
    return nullptr;
  }
  if (const auto name = bound_name(y))
  {
    hoisted.push_back(y);
    return var(*name);
  }
  return y;
}


/** Lifted child of a node, in evaluation order */
struct _slot {
  node_ptr value;
  size_t mark;  /**< size of the hoisted list once the slot is evaluated */
  bool hoists;
};

static bool
_rebound_after(node_ptr x, const node_list &hoisted, size_t mark)
{
  bool rebound = false;
  walk(x, [&](node_ptr y) {
    if (const auto name = var_name(y))
    {
      for (size_t i = mark; i < hoisted.size() and not rebound; ++i)
        rebound = binds(hoisted[i], *name);
    }
    return not rebound;
  });
  return rebound;
}

/**
 * Bind slots evaluated before the last hoisting one to temporaries
 *
 * A slot is bound where it was evaluated if it has effects or reads a
 * variable rebound by a later hoisted statement. Returns false if no slot
 * changed.
 */
static bool
_pin_slots(std::vector<_slot> &slots, node_list &hoisted, name_generator &gensym)
{
  size_t last = 0;
  bool any = false;
  for (size_t k = 0; k < slots.size(); ++k)
  {
    if (slots[k].hoists)
    {
      last = k;
      any = true;
    }
  }
  if (not any)
    return false;

  size_t shift = 0;
  bool changed = false;
  for (size_t k = 0; k < last; ++k)
  {
    _slot &s = slots[k];
    if (not s.value)
      continue;
    if (is_pure(s.value) and not _rebound_after(s.value, hoisted, s.mark + shift))
      continue;
    const std::string name = gensym("temp_{}");
    hoisted.insert(hoisted.begin() + s.mark + shift, bind(name, s.value));
    ++shift;
    s.value = var(name);
    changed = true;
  }
  return changed;
}

static node_ptr
_lift_list(node_ptr x, const list_node &l, node_list &hoisted,
           name_generator &gensym)
{
  std::vector<_slot> slots;
  bool changed = false;
  for (const node_ptr e : l.elements)
  {
    const size_t before = hoisted.size();
    const node_ptr y = _lift_slot(e, hoisted, true, gensym);
    changed |= y != e;
    slots.push_back({y, hoisted.size(), hoisted.size() > before});
  }

  node_ptr tail = nullptr;
  if (l.tail)
  {
    const size_t before = hoisted.size();
    tail = _lift(l.tail, hoisted, gensym);
    slots.push_back({tail, hoisted.size(), hoisted.size() > before});
  }

  changed |= _pin_slots(slots, hoisted, gensym);
  if (not changed and tail == l.tail)
    return x;

  if (l.tail)
  {
    tail = slots.back().value;
    slots.pop_back();
  }
  node_list elements;
  for (const _slot &s : slots)
  {
    if (s.value)
      elements.push_back(s.value);
  }
  return make_node(list_node {std::move(elements), tail}, x->meta);
}

static bool
_descends(node_ptr x) noexcept
{
  if (const call_node *c = x->get<call_node>())
    return c->name != printer::while_placeholder;
  return x->is<tuple_node>() or x->is<map_node>() or
         x->is<keyword_node>() or x->is<struct_node>() or
         x->is<remote_call_node>() or
         x->is<apply_node>() or x->is<binary_node>() or
         x->is<unary_node>() or x->is<paren_node>() or
         x->is<match_node>() or x->is<assign_node>() or
         x->is<if_node>() or x->is<case_node>();
}

static bool
_short_circuits(node_ptr x) noexcept
{
  const binary_node *b = x->get<binary_node>();
  return b and (b->op == binary_op::and_ or b->op == binary_op::or_);
}

static node_ptr
_lift(node_ptr x, node_list &hoisted, name_generator &gensym)
{
  if (const list_node *l = x->get<list_node>())
    return _lift_list(x, *l, hoisted, gensym);
  if (not _descends(x))
    return x;

  // Right operand of `and`/`or` runs conditionally
  const bool short_circuit = _short_circuits(x);
  std::vector<_slot> slots;
  const node_ptr y = rebuild(x, [&](node_ptr child, child_role role) {
    const size_t before = hoisted.size();
    node_ptr z = child;
    switch (role)
    {
      case child_role::element:
      case child_role::map_value:
        z = _lift_slot(child, hoisted, false, gensym);
        break;
      case child_role::operand:
        if (short_circuit and not slots.empty())
          break;
        [[fallthrough]];
      case child_role::argument:
      case child_role::paren:
      case child_role::match_rhs:
      case child_role::condition:
      case child_role::subject:
        z = child->is<block_node>() ? _lift_slot(child, hoisted, false, gensym)
                                    : _lift(child, hoisted, gensym);
        break;
      default:
        break;
    }
    slots.push_back({z, hoisted.size(), hoisted.size() > before});
    return z;
  });

  if (not _pin_slots(slots, hoisted, gensym))
    return y;
  size_t k = 0;
  return rebuild(y, [&](node_ptr, child_role) { return slots[k++].value; });
}

node_ptr
effect_lifting(node_ptr root, name_generator &gensym)
{
  return expand_statements(root, [&](node_ptr stmt) {
    node_list statements;
    const node_ptr lifted = _lift(stmt, statements, gensym);
    if (statements.empty())
      return node_list {stmt};
    statements.push_back(lifted);
    return statements;
  });
}

} // namespace alm::passes
