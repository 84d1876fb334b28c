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

#include <algorithm>


namespace alm::passes {

using namespace alm::ast;


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                            loop reconstruction
static std::optional<int64_t>
_int_value(node_ptr x) noexcept
{
  if (const literal_node *l = x->get<literal_node>())
  {
    if (const int64_t *i = std::get_if<int64_t>(&l->value))
      return *i;
  }
  return std::nullopt;
}

/**
 * Elements appended by an unrolled accumulation block
 *
 * The block must read `g = []`, then `g = g ++ [e]` for each element, then
 * `g`.
 */
static std::optional<node_list>
_accumulated_elements(const block_node &b)
{
  const node_list &stmts = b.statements;
  if (stmts.size() < 3)
    return std::nullopt;

  const auto acc = bound_name(stmts.front());
  if (not acc or not is_var(stmts.back(), *acc))
    return std::nullopt;
  const list_node *init = stmts.front()->get<match_node>()->value->get<list_node>();
  if (not init or not init->elements.empty() or init->tail)
    return std::nullopt;

  node_list elements;
  for (size_t i = 1; i + 1 < stmts.size(); ++i)
  {
    if (bound_name(stmts[i]) != *acc)
      return std::nullopt;
    const binary_node *step = stmts[i]->get<match_node>()->value->get<binary_node>();
    if (not step or step->op != binary_op::list_concat or
        not is_var(step->lhs, *acc))
      return std::nullopt;
    const list_node *appended = step->rhs->get<list_node>();
    if (not appended or appended->elements.size() != 1 or appended->tail)
      return std::nullopt;
    const node_ptr element = appended->elements.front();
    if (reads(element, *acc))
      return std::nullopt;
    elements.push_back(element);
  }
  return elements;
}

static node_ptr
_comprehension(std::string_view index, size_t count, node_ptr body)
{
  for_node f;
  f.generators.push_back({
    pvar(index),
    range(int_lit(0), int_lit(static_cast<int64_t>(count) - 1))
  });
  f.body = body;
  return make_node(std::move(f));
}

/**
 * Index variables of one definition
 *
 * `i` and `j` are used unless the definition already has a binding of that
 * name, in which case a fresh name is minted on first use.
 */
class _index_names {
  public:
  _index_names(node_ptr scope, name_generator &gensym)
  : m_scope {scope}, m_gensym {gensym}
  { }

  const std::string&
  outer()
  { return _get(m_outer, "i"); }

  const std::string&
  inner()
  { return _get(m_inner, "j"); }

  private:
  const std::string&
  _get(std::optional<std::string> &slot, std::string_view preferred)
  {
    if (not slot)
    {
      if (reads(m_scope, preferred) or binds(m_scope, preferred))
        slot = m_gensym(std::string {preferred} + "_{}");
      else
        slot = std::string {preferred};
    }
    return *slot;
  }

  node_ptr m_scope;
  name_generator &m_gensym;
  std::optional<std::string> m_outer, m_inner;
}; // class alm::passes::_index_names

/**
 * Int elements of every row, if all rows are int lists of the same length
 */
static std::optional<std::vector<std::vector<int64_t>>>
_int_rows(const node_list &elements)
{
  std::vector<std::vector<int64_t>> rows;
  for (const node_ptr e : elements)
  {
    const list_node *row = e->get<list_node>();
    if (not row or row->tail or row->elements.empty())
      return std::nullopt;
    std::vector<int64_t> values;
    for (const node_ptr x : row->elements)
    {
      const auto i = _int_value(x);
      if (not i)
        return std::nullopt;
      values.push_back(*i);
    }
    if (not rows.empty() and rows.front().size() != values.size())
      return std::nullopt;
    rows.push_back(std::move(values));
  }
  return rows;
}

static node_ptr
_loop_body(const node_list &elements, _index_names &names)
{
  const size_t n = elements.size();

  bool indices = true;
  for (size_t k = 0; k < n and indices; ++k)
    indices = _int_value(elements[k]) == static_cast<int64_t>(k);
  if (indices)
    return var(names.outer());

  if (const auto rows = _int_rows(elements))
  {
    const size_t m = rows->front().size();
    bool columns = true, flat = true;
    for (size_t k = 0; k < n; ++k)
    {
      for (size_t j = 0; j < m; ++j)
      {
        const int64_t x = (*rows)[k][j];
        columns = columns and x == static_cast<int64_t>(j);
        flat = flat and x == static_cast<int64_t>(k * m + j);
      }
    }
    if (columns)
    {
      const std::string &j = names.inner();
      return _comprehension(j, m, var(j));
    }
    if (flat)
    {
      const std::string &i = names.outer();
      const std::string &j = names.inner();
      const node_ptr offset =
        binary(binary_op::mul, var(i), int_lit(static_cast<int64_t>(m)));
      return _comprehension(j, m, binary(binary_op::add, offset, var(j)));
    }
    return nullptr;
  }

  // Identical rows that were themselves reconstructed
  if (elements.front()->is<for_node>())
  {
    const std::string first = dump(elements.front());
    const bool same = std::all_of(elements.begin(), elements.end(),
      [&](node_ptr e) { return e->is<for_node>() and dump(e) == first; });
    if (same)
      return elements.front();
  }

  return nullptr;
}

static node_ptr
_reconstruct(node_ptr x, _index_names &names)
{
  const block_node *b = x->get<block_node>();
  if (not b or not meta_of(x).unrolled_loop)
    return x;

  const auto elements = _accumulated_elements(*b);
  if (not elements)
    return x;

  if (const node_ptr body = _loop_body(*elements, names))
  {
    return _comprehension(names.outer(), elements->size(),
                          body->is<for_node>() ? paren(body) : body);
  }
  return list_of(*elements);
}

static node_ptr
_reconstruct_scope(node_ptr scope, name_generator &gensym)
{
  _index_names names {scope, gensym};
  return rewrite(scope, [&](node_ptr x) { return _reconstruct(x, names); });
}

node_ptr
loop_reconstruction(node_ptr root, name_generator &gensym)
{
  return map_definitions(root, [&](node_ptr scope) {
    return _reconstruct_scope(scope, gensym);
  });
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                        enum pattern reconstruction
/** Variable `x` of a `elem(x, k)` call, with `k` */
static std::optional<std::pair<std::string_view, int64_t>>
_tuple_element(node_ptr x) noexcept
{
  const call_node *c = x->get<call_node>();
  if (not c or c->name != "elem" or c->args.size() != 2)
    return std::nullopt;
  const auto subject = var_name(c->args[0]);
  const auto index = _int_value(c->args[1]);
  if (not subject or not index)
    return std::nullopt;
  return std::make_pair(*subject, *index);
}

static std::optional<int64_t>
_tag_literal(pattern_ptr p) noexcept
{
  if (const literal_pattern *l = p->get<literal_pattern>())
    return _int_value(l->value);
  return std::nullopt;
}

/**
 * Rewrite one tag clause into a tuple clause
 *
 * Leading `v = elem(x, k)` statements of the body become the payload slots of
 * the tuple pattern.
 */
static std::optional<clause>
_tuple_clause(const clause &c, int64_t tag, std::string_view subject)
{
  const node_list stmts = statements_of(c.body);
  std::vector<std::pair<int64_t, stl::string>> extracted;
  size_t consumed = 0;
  for (; consumed < stmts.size(); ++consumed)
  {
    const auto name = bound_name(stmts[consumed]);
    if (not name)
      break;
    const auto element =
      _tuple_element(stmts[consumed]->get<match_node>()->value);
    if (not element or element->first != subject or element->second < 1)
      break;
    const bool duplicate = std::ranges::any_of(extracted,
      [&](const auto &e) { return e.first == element->second; });
    if (duplicate)
      break;
    extracted.emplace_back(element->second, stl::string {*name});
  }

  int64_t arity = 0;
  for (const auto &e : extracted)
    arity = std::max(arity, e.first);
  if (const auto hint = meta_of(c.body).payload_arity)
  {
    if (*hint < arity)
      return std::nullopt;
    arity = *hint;
  }

  pattern_list slots {plit(int_lit(tag))};
  for (int64_t k = 1; k <= arity; ++k)
  {
    const auto it = std::ranges::find(extracted, k,
      &std::pair<int64_t, stl::string>::first);
    slots.push_back(it == extracted.end() ? pwild() : pvar(it->second));
  }

  const node_list rest {stmts.begin() + consumed, stmts.end()};
  const node_ptr body = rest.empty() ? nil_lit() : make_sequence(rest, c.body);
  return clause {ptuple(std::move(slots)), c.guard, body};
}

static node_ptr
_reconstruct_enum_case(node_ptr x)
{
  const case_node *n = x->get<case_node>();
  if (not n)
    return x;
  const auto element = _tuple_element(n->subject);
  if (not element or element->second != 0)
    return x;

  bool any_tag = false;
  for (const clause &c : n->clauses)
  {
    if (_tag_literal(c.pattern))
      any_tag = true;
    else if (not c.pattern->is<wildcard_pattern>())
      return x;
  }
  if (not any_tag)
    return x;

  case_node result {var(element->first), { }};
  for (const clause &c : n->clauses)
  {
    if (const auto tag = _tag_literal(c.pattern))
    {
      const auto rewritten = _tuple_clause(c, *tag, element->first);
      if (not rewritten)
        return x;
      result.clauses.push_back(*rewritten);
    }
    else
      result.clauses.push_back(c);
  }
  return make_node(std::move(result), x->meta);
}

node_ptr
enum_pattern_reconstruction(node_ptr root)
{ return rewrite(root, _reconstruct_enum_case); }

} // namespace alm::passes
