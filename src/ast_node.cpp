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


#include "alembic/ast/node.hpp"
#include "alembic/ast/traversal.hpp"
#include "alembic/printer/operators.hpp"
#include "alembic/value.hpp"

#include <array>
#include <format>
#include <sstream>


namespace alm::ast {

static const metadata g_empty_metadata;

static constexpr std::array<std::string_view, 37> g_kind_names {
  "var", "literal", "atom", "nil", "underscore", "alias", "raw",
  "module", "def", "attribute", "directive",
  "if", "case", "cond", "try", "with", "receive",
  "list", "tuple", "map", "keyword", "struct", "bitstring",
  "call", "remote-call", "apply", "binary", "unary",
  "field", "access", "range", "paren", "block",
  "match", "assign", "fn", "for",
};
static_assert(g_kind_names.size() == std::variant_size_v<node_variant>);


const metadata&
meta_of(node_ptr x) noexcept
{ return x->meta ? *x->meta : g_empty_metadata; }

node_ptr
with_meta(node_ptr x, const metadata &meta)
{ return make<node>(x->data, make<metadata>(meta)); }

node_ptr
inherit_meta(node_ptr x, node_ptr origin)
{
  if (x == origin or not origin->meta or x->meta == origin->meta)
    return x;

  const metadata &from = *origin->meta;
  metadata meta = meta_of(x);
  for (const auto &[id, name] : from.clause_names)
    meta.clause_names.emplace(id, name);
  meta.keep_inline |= from.keep_inline;
  meta.is_exception |= from.is_exception;
  meta.unrolled_loop |= from.unrolled_loop;
  if (from.payload_arity)
    meta.payload_arity = from.payload_arity;
  if (meta.unused_private_functions.empty())
    meta.unused_private_functions = from.unused_private_functions;
  return with_meta(x, meta);
}

std::string_view
kind_name(node_ptr x) noexcept
{ return g_kind_names[x->data.index()]; }


static std::string
_literal_text(const literal_node &x)
{
  return std::visit([]<typename T>(const T &v) -> std::string {
    if constexpr (std::same_as<T, stl::string>)
    {
      std::ostringstream buf;
      write(buf, str(v));
      return buf.str();
    }
    else if constexpr (std::same_as<T, bool>)
      return v ? "true" : "false";
    else
      return std::format("{}", v);
  }, x.value);
}

// Scalar attributes shown after the kind name
static std::string
_label(node_ptr x)
{
  if (const auto *v = x->get<var_node>())
    return std::string {v->name};
  if (const auto *l = x->get<literal_node>())
    return _literal_text(*l);
  if (const auto *a = x->get<atom_node>())
    return std::format(":{}", a->name);
  if (const auto *a = x->get<alias_node>())
    return std::string {a->name};
  if (const auto *r = x->get<raw_node>())
    return _literal_text(literal_node {r->code});
  if (const auto *m = x->get<module_node>())
    return std::string {m->name};
  if (const auto *d = x->get<def_node>())
  {
    const std::string_view kind = d->kind == def_kind::def  ? "def"
                                : d->kind == def_kind::defp ? "defp"
                                                            : "defmacro";
    return std::format("{} {}/{}", kind, d->name, d->params.size());
  }
  if (const auto *a = x->get<attribute_node>())
    return std::format("@{}", a->name);
  if (const auto *d = x->get<directive_node>())
    return std::string {d->module};
  if (const auto *c = x->get<call_node>())
    return std::string {c->name};
  if (const auto *c = x->get<remote_call_node>())
    return std::string {c->name};
  if (const auto *b = x->get<binary_node>())
    return std::string {operator_token(b->op)};
  if (const auto *u = x->get<unary_node>())
    return std::string {operator_token(u->op)};
  if (const auto *f = x->get<field_node>())
    return std::format(".{}", f->field);
  if (const auto *s = x->get<struct_node>())
    return std::string {s->module};
  return "";
}

static void
_dump(std::ostream &os, node_ptr x, size_t depth)
{
  os << std::string(depth * 2, ' ') << '(' << kind_name(x);
  if (const std::string label = _label(x); not label.empty())
    os << ' ' << label;

  const metadata &meta = meta_of(x);
  if (meta.unrolled_loop)
    os << " #unrolled";
  if (meta.keep_inline)
    os << " #inline";
  if (meta.is_exception)
    os << " #exception";
  if (meta.source_id)
    os << " #id=" << *meta.source_id;

  for_each_child(x,
    [&](node_ptr child, child_role) {
      os << '\n';
      _dump(os, child, depth + 1);
    },
    [&](pattern_ptr p) {
      os << '\n' << std::string((depth + 1) * 2, ' ') << dump(p);
    });
  os << ')';
}

std::string
dump(node_ptr x)
{
  std::ostringstream buf;
  _dump(buf, x, 0);
  return buf.str();
}

std::string
dump(pattern_ptr p)
{
  return std::visit([&]<typename T>(const T &x) -> std::string {
    std::ostringstream buf;
    if constexpr (std::same_as<T, var_pattern>)
      buf << "[var " << x.name << ']';
    else if constexpr (std::same_as<T, literal_pattern>)
      buf << "[lit " << _label(x.value) << ']';
    else if constexpr (std::same_as<T, pin_pattern>)
      buf << "[pin " << x.name << ']';
    else if constexpr (std::same_as<T, wildcard_pattern>)
      buf << "[_]";
    else
    {
      if constexpr (std::same_as<T, tuple_pattern>)
        buf << "[tuple";
      else if constexpr (std::same_as<T, list_pattern>)
        buf << "[list";
      else if constexpr (std::same_as<T, cons_pattern>)
        buf << "[cons";
      else if constexpr (std::same_as<T, map_pattern>)
        buf << "[map";
      else if constexpr (std::same_as<T, struct_pattern>)
        buf << "[struct " << x.module;
      else
        buf << "[bitstring";
      for_each_subpattern(p, [&](pattern_ptr q) { buf << ' ' << dump(q); });
      buf << ']';
    }
    return buf.str();
  }, p->data);
}

} // namespace alm::ast
