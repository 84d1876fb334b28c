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
#include "alembic/ast/traversal.hpp"
#include "alembic/logging.hpp"
#include "alembic/naming.hpp"

#include <algorithm>


namespace alm::passes {

using namespace alm::ast;


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                               usage hygiene
static std::vector<std::string>
_bound_names(node_ptr scope)
{
  std::vector<std::string> names;
  walk(scope, [&](node_ptr x) {
    for_each_child(x, [](node_ptr, child_role) { }, [&](pattern_ptr p) {
      for (const stl::string &name : pattern_variables(p))
      {
        const std::string_view view {name};
        const auto same = [&](const std::string &n) { return n == view; };
        if (std::ranges::none_of(names, same))
          names.emplace_back(view);
      }
    });
    return true;
  });
  return names;
}

/**
 * Reads of \p name, not counting reads on the right-hand side of a match that
 * rebinds \p name
 */
static size_t
_uses(node_ptr scope, std::string_view name)
{
  const size_t total = count_reads(scope, name);
  size_t self = 0;
  walk(scope, [&](node_ptr x) {
    if (const match_node *m = x->get<match_node>())
    {
      const auto bound = pattern_variables(m->pattern);
      const auto same = [&](const auto &b) { return b == name; };
      if (std::ranges::any_of(bound, same))
        self += count_reads(m->value, name);
    }
    return true;
  });
  return self >= total ? 0 : total - self;
}

static bool
_is_taken(node_ptr scope, std::string_view name)
{ return reads(scope, name) or binds(scope, name); }

static node_ptr
_hygiene(node_ptr scope)
{
  for (const std::string &name : _bound_names(scope))
  {
    if (name == "_")
      continue;

    const size_t uses = _uses(scope, name);
    if (name.front() != '_')
    {
      if (uses > 0)
        continue;
      const std::string ignored = "_" + name;
      if (_is_taken(scope, ignored))
        continue;
      debug("unused binding {} -> {}", name, ignored);
      scope = rename(scope, name, ignored);
    }
    else if (not name.starts_with("__") and uses > 0)
    {
      const std::string used = name.substr(1);
      if (is_reserved_word(used) or _is_taken(scope, used))
        continue;
      debug("used binding {} -> {}", name, used);
      scope = rename(scope, name, used);
    }
  }
  return scope;
}

node_ptr
usage_hygiene(node_ptr root)
{ return map_definitions(root, _hygiene); }


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                         unused private functions
static bool
_calls(node_ptr x, std::string_view name, size_t arity)
{
  bool found = false;
  walk(x, [&](node_ptr y) {
    if (const call_node *c = y->get<call_node>())
      found = found or (c->name == name and c->args.size() == arity);
    return not found;
  });
  return found;
}

static node_ptr
_record_unused(node_ptr x)
{
  const module_node *m = x->get<module_node>();
  if (not m)
    return x;

  stl::vector<std::pair<stl::string, size_t>> unused;
  for (const node_ptr item : m->body)
  {
    const def_node *d = item->get<def_node>();
    if (not d or d->kind != def_kind::defp)
      continue;
    const size_t arity = d->params.size();
    const bool called = std::ranges::any_of(m->body, [&](node_ptr other) {
      return other != item and _calls(other, d->name, arity);
    });
    if (not called)
      unused.emplace_back(d->name, arity);
  }

  if (unused == meta_of(x).unused_private_functions)
    return x;
  metadata meta = meta_of(x);
  meta.unused_private_functions = std::move(unused);
  return with_meta(x, meta);
}

node_ptr
unused_private_functions(node_ptr root)
{ return rewrite(root, _record_unused); }


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                              bitwise import
static bool
_is_bitwise_directive(node_ptr x) noexcept
{
  const directive_node *d = x->get<directive_node>();
  return d and d->module == "Bitwise";
}

static bool
_is_moduledoc(node_ptr x) noexcept
{
  const attribute_node *a = x->get<attribute_node>();
  return a and a->name == "moduledoc";
}

static node_ptr
_require_bitwise(node_ptr x)
{
  const module_node *m = x->get<module_node>();
  if (not m or not uses_bitwise(x) or
      std::ranges::any_of(m->body, _is_bitwise_directive))
    return x;

  module_node result = *m;
  const auto at = std::ranges::find_if_not(result.body, _is_moduledoc);
  result.body.insert(at, make_node(directive_node {
    directive_kind::require, "Bitwise", nullptr
  }));
  return make_node(std::move(result), x->meta);
}

node_ptr
bitwise_import(node_ptr root)
{ return rewrite(root, _require_bitwise); }

} // namespace alm::passes
