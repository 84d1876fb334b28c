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

#include <vector>


namespace alm::passes {

using namespace alm::ast;


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                          clause-local resolution
using _name_map = stl::unordered_map<long, stl::string>;
using _name_scopes = std::vector<const _name_map*>;

static const stl::string*
_lookup(const _name_scopes &scopes, long id)
{
  for (auto it = scopes.rbegin(); it != scopes.rend(); ++it)
  {
    if (const auto found = (*it)->find(id); found != (*it)->end())
      return &found->second;
  }
  return nullptr;
}

static node_ptr
_resolve(node_ptr x, _name_scopes &scopes)
{
  if (x->is<raw_node>())
    return x;

  const metadata &meta = meta_of(x);
  const bool has_names = not meta.clause_names.empty();
  if (has_names)
    scopes.push_back(&meta.clause_names);

  node_ptr result = x;
  if (x->is<var_node>())
  {
    if (meta.source_id)
    {
      if (const stl::string *name = _lookup(scopes, *meta.source_id))
        result = make_node(var_node {*name}, x->meta);
    }
  }
  else
  {
    result = rebuild(x,
      [&](node_ptr child, child_role) { return _resolve(child, scopes); },
      [&](pattern_ptr p) {
        return rewrite_pattern(p, [&](pattern_ptr q) -> pattern_ptr {
          const var_pattern *v = q->get<var_pattern>();
          if (not v or not v->source_id)
            return q;
          if (const stl::string *name = _lookup(scopes, *v->source_id))
            return make_pattern(var_pattern {*name, v->source_id});
          return q;
        });
      });
  }

  if (has_names)
    scopes.pop_back();
  return result;
}

node_ptr
clause_local_resolution(node_ptr root)
{
  _name_scopes scopes;
  return _resolve(root, scopes);
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                           temp-binding collapse
static node_ptr
_try_collapse(node_ptr x)
{
  const block_node *block = x->get<block_node>();
  if (not block or block->statements.size() != 2)
    return x;

  const node_ptr binding = block->statements[0];
  const node_ptr use = block->statements[1];
  const std::optional<std::string_view> tmp = bound_name(binding);
  if (not tmp or binds(use, *tmp))
    return x;

  const size_t nreads = count_reads(use, *tmp);
  if (nreads == 0)
    return x;

  const node_ptr value = binding->get<match_node>()->value;
  if (nreads == 1 or is_pure(value))
    return substitute(use, *tmp, paren(value));
  return substitute_first(use, *tmp, paren(binding), var(*tmp));
}

static node_ptr
_collapse(node_ptr x)
{
  if (x->is<raw_node>())
    return x;

  return rebuild(x, [](node_ptr child, child_role role) {
    const node_ptr y = _collapse(child);
    return is_expression_role(role) ? _try_collapse(y) : y;
  });
}

node_ptr
temp_binding_collapse(node_ptr root)
{ return _collapse(root); }

} // namespace alm::passes
