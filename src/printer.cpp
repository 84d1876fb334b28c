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


#include "alembic/printer/printer.hpp"
#include "alembic/printer/operators.hpp"
#include "alembic/ast/analysis.hpp"
#include "alembic/ast/traversal.hpp"
#include "alembic/exceptions.hpp"
#include "alembic/utilities/state_saver.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>


namespace alm {

using namespace alm::ast;


static std::string
_ind(int n)
{ return std::string(n * 2, ' '); }

template <typename Range, typename Fn>
static std::string
_join(const Range &range, std::string_view sep, Fn fn)
{
  std::string result;
  bool first = true;
  for (const auto &x : range)
  {
    if (not first)
      result.append(sep);
    result.append(fn(x));
    first = false;
  }
  return result;
}


bool
is_bare_atom(std::string_view name) noexcept
{
  if (name.empty())
    return false;

  const auto isword = [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) or c == '_';
  };
  if (not (std::isalpha(static_cast<unsigned char>(name[0])) or name[0] == '_'))
    return false;

  size_t end = name.size();
  if (name.back() == '!' or name.back() == '?')
    end -= 1;
  for (size_t i = 1; i < end; ++i)
  {
    if (not isword(name[i]))
      return false;
  }
  return true;
}

std::string
escape_string(std::string_view text)
{
  std::string result;
  result.reserve(text.size());
  for (const char c : text)
  {
    switch (c)
    {
      case '\\': result.append("\\\\"); break;
      case '"': result.append("\\\""); break;
      case '\n': result.append("\\n"); break;
      case '\r': result.append("\\r"); break;
      case '\t': result.append("\\t"); break;
      default: result.push_back(c);
    }
  }
  return result;
}

std::string
atom_literal(std::string_view name)
{
  if (is_bare_atom(name))
    return std::format(":{}", name);
  return std::format(":\"{}\"", escape_string(name));
}

// Key of a keyword list or an atom-keyed map
static std::string
_keyword_key(std::string_view name)
{
  if (is_bare_atom(name))
    return std::format("{}:", name);
  return std::format("\"{}\":", escape_string(name));
}

static std::string
_float_text(double x)
{
  std::string text = std::format("{}", x);
  if (not std::isfinite(x))
    throw internal_defect {"printer", "float literal is not finite", text};
  if (text.find_first_of(".ein") != std::string::npos)
  {
    // 1e+20 => 1.0e20
    if (const size_t e = text.find('e'); e != std::string::npos)
    {
      if (text[e + 1] == '+')
        text.erase(e + 1, 1);
      if (text.find('.') == std::string::npos)
        text.insert(e, ".0");
    }
    return text;
  }
  return text + ".0";
}


bool
is_simple(node_ptr x)
{
  if (x->is<var_node>() or x->is<literal_node>() or x->is<atom_node>() or
      x->is<nil_node>() or x->is<underscore_node>() or x->is<alias_node>())
    return true;

  if (const field_node *f = x->get<field_node>())
    return is_simple(f->object);
  if (const paren_node *p = x->get<paren_node>())
    return is_simple(p->inner);

  const auto simple_children = [](node_ptr y) {
    bool simple = true;
    for_each_child(y, [&](node_ptr child, child_role) {
      simple = simple and is_simple(child);
    });
    return simple;
  };

  if (x->is<access_node>() or x->is<unary_node>() or x->is<binary_node>() or
      x->is<range_node>() or x->is<list_node>() or x->is<tuple_node>() or
      x->is<map_node>() or x->is<keyword_node>() or x->is<struct_node>() or
      x->is<bitstring_node>())
    return simple_children(x);

  if (const call_node *c = x->get<call_node>())
  {
    return c->name != printer::while_placeholder and c->args.size() <= 2 and
           simple_children(x);
  }
  if (const remote_call_node *c = x->get<remote_call_node>())
    return c->args.size() <= 2 and simple_children(x);
  if (const apply_node *a = x->get<apply_node>())
    return a->args.size() <= 2 and simple_children(x);

  return false;
}


static bool
_is_while(node_ptr x)
{
  const call_node *c = x->get<call_node>();
  return c and c->name == printer::while_placeholder;
}

// Expressions that can be followed by `.field` or `[key]` without parens
static bool
_is_postfix_safe(node_ptr x)
{
  return x->is<var_node>() or x->is<field_node>() or x->is<access_node>() or
         x->is<call_node>() or x->is<remote_call_node>() or
         x->is<apply_node>() or x->is<alias_node>() or x->is<paren_node>() or
         x->is<map_node>() or x->is<struct_node>() or x->is<list_node>() or
         x->is<tuple_node>() or x->is<atom_node>();
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                                node visitor
struct _printer_visitor {
  printer &self;
  node_ptr x;
  int indent;
  printer::slot where;

  std::string
  expr(node_ptr y, printer::slot s = printer::slot::plain)
  { return self._expr(y, indent, s); }

  // Conditionals used as values are wrapped when not in a plain slot
  std::string
  wrap(std::string text)
  { return where == printer::slot::plain ? text : std::format("({})", text); }

  std::string
  operator () (const var_node &v)
  { return std::string {v.name}; }

  std::string
  operator () (const literal_node &l)
  {
    return std::visit([]<typename T>(const T &v) -> std::string {
      if constexpr (std::same_as<T, int64_t>)
        return std::format("{}", v);
      else if constexpr (std::same_as<T, double>)
        return _float_text(v);
      else if constexpr (std::same_as<T, bool>)
        return v ? "true" : "false";
      else
        return std::format("\"{}\"", escape_string(v));
    }, l.value);
  }

  std::string
  operator () (const atom_node &a)
  { return atom_literal(a.name); }

  std::string
  operator () (const nil_node &)
  { return "nil"; }

  std::string
  operator () (const underscore_node &)
  { return "_"; }

  std::string
  operator () (const alias_node &a)
  { return std::string {a.name}; }

  std::string
  operator () (const raw_node &r)
  { return std::string {r.code}; }

  std::string
  operator () (const module_node &)
  { return self._module(*x, indent); }

  std::string
  operator () (const def_node &d)
  { return self._def(d, indent); }

  std::string
  operator () (const attribute_node &a)
  {
    if (a.value == nullptr)
      return std::format("@{}", a.name);
    return std::format("@{} {}", a.name, expr(a.value));
  }

  std::string
  operator () (const directive_node &d)
  {
    std::string_view kind;
    switch (d.kind)
    {
      case directive_kind::import_: kind = "import"; break;
      case directive_kind::alias: kind = "alias"; break;
      case directive_kind::require: kind = "require"; break;
      case directive_kind::use: kind = "use"; break;
    }
    std::string text = std::format("{} {}", kind, d.module);
    if (d.options)
    {
      if (const keyword_node *kw = d.options->get<keyword_node>())
        text += ", " + self._fields(kw->entries, indent);
      else
        text += ", " + expr(d.options, printer::slot::argument);
    }
    return text;
  }

  std::string
  operator () (const if_node &)
  { return wrap(self._if(*x, indent)); }

  std::string
  operator () (const case_node &c)
  {
    return wrap(std::format("case {} do\n{}\n{}end",
                             expr(c.subject), self._clauses(c.clauses, indent),
                             _ind(indent)));
  }

  std::string
  operator () (const cond_node &c)
  {
    const std::string branches = _join(c.branches, "\n", [&](const auto &b) {
      return std::format("{}{} ->{}", _ind(indent + 1), expr(b.condition),
                         self._clause_body(b.body, indent + 1));
    });
    return wrap(std::format("cond do\n{}\n{}end", branches, _ind(indent)));
  }

  std::string
  operator () (const try_node &t)
  { return wrap(self._try(t, indent)); }

  std::string
  operator () (const with_node &w)
  {
    const std::string bindings = _join(w.bindings, ", ", [&](const auto &b) {
      return std::format("{} <- {}", self.print_pattern(b.pattern),
                         expr(b.value, printer::slot::argument));
    });
    std::string text = std::format("with {} do\n{}", bindings,
                                   self._statements(w.body, indent + 1));
    if (not w.else_clauses.empty())
    {
      text += std::format("\n{}else\n{}", _ind(indent),
                          self._clauses(w.else_clauses, indent));
    }
    return wrap(std::format("{}\n{}end", text, _ind(indent)));
  }

  std::string
  operator () (const receive_node &r)
  {
    std::string text = "receive do";
    if (not r.clauses.empty())
      text += "\n" + self._clauses(r.clauses, indent);
    if (r.timeout)
    {
      text += std::format("\n{}after\n{}{} ->{}", _ind(indent), _ind(indent + 1),
                          expr(r.timeout),
                          self._clause_body(r.after_body, indent + 1));
    }
    return wrap(std::format("{}\n{}end", text, _ind(indent)));
  }

  std::string
  operator () (const list_node &l)
  {
    std::string text = self._args(l.elements, indent);
    if (l.tail)
      text += " | " + expr(l.tail, printer::slot::argument);
    return std::format("[{}]", text);
  }

  std::string
  operator () (const tuple_node &t)
  { return std::format("{{{}}}", self._args(t.elements, indent)); }

  std::string
  operator () (const map_node &m)
  { return self._map(m, indent); }

  std::string
  operator () (const keyword_node &k)
  { return std::format("[{}]", self._fields(k.entries, indent)); }

  std::string
  operator () (const struct_node &s)
  {
    const std::string fields = self._fields(s.fields, indent);
    if (s.base)
      return std::format("%{}{{{} | {}}}", s.module, expr(s.base), fields);
    return std::format("%{}{{{}}}", s.module, fields);
  }

  std::string
  operator () (const bitstring_node &b)
  {
    const std::string segments = _join(b.segments, ", ", [&](const auto &s) {
      const std::string v = expr(s.value, printer::slot::argument);
      return s.spec.empty() ? v : std::format("{}::{}", v, s.spec);
    });
    return std::format("<<{}>>", segments);
  }

  std::string
  operator () (const call_node &c)
  {
    if (c.name == printer::while_placeholder)
    {
      if (c.args.size() != 2)
        throw internal_defect {"printer", "malformed while-loop placeholder",
                               dump(x)};
      return self._iife(x, indent);
    }
    if (c.name == "defstruct")
    {
      return std::format("{} {}",
                         self.m_exception_module ? "defexception" : "defstruct",
                         self._args(c.args, indent));
    }
    return std::format("{}({})", c.name, self._args(c.args, indent));
  }

  std::string
  operator () (const remote_call_node &c)
  {
    std::string target = expr(c.target, printer::slot::operand);
    if (not _is_postfix_safe(c.target))
      target = std::format("({})", target);
    const std::string name =
        is_bare_atom(c.name) ? std::string {c.name}
                             : std::format("\"{}\"", escape_string(c.name));
    return std::format("{}.{}({})", target, name, self._args(c.args, indent));
  }

  std::string
  operator () (const apply_node &a)
  {
    std::string function = expr(a.function, printer::slot::operand);
    if (not _is_postfix_safe(a.function))
      function = std::format("({})", function);
    return std::format("{}.({})", function, self._args(a.args, indent));
  }

  std::string
  operator () (const binary_node &b)
  {
    if (prints_as_call(b.op))
    {
      return std::format("{}{}({}, {})", is_bitwise(b.op) ? "Bitwise." : "",
                         operator_token(b.op),
                         expr(b.lhs, printer::slot::argument),
                         expr(b.rhs, printer::slot::argument));
    }
    return std::format("{} {} {}", self._operand(b.lhs, b.op, true, indent),
                       operator_token(b.op),
                       self._operand(b.rhs, b.op, false, indent));
  }

  std::string
  operator () (const unary_node &u)
  {
    const std::string operand = expr(u.operand, printer::slot::operand);
    switch (u.op)
    {
      case unary_op::negate: {
        const literal_node *lit = u.operand->get<literal_node>();
        const bool bare = _is_postfix_safe(u.operand) or
            (lit and not operand.starts_with('-') and
             not std::holds_alternative<stl::string>(lit->value));
        return bare ? "-" + operand : std::format("-({})", operand);
      }
      case unary_op::not_:
        if (_is_postfix_safe(u.operand) or is_literal(u.operand))
          return "!" + operand;
        return std::format("!({})", operand);
      case unary_op::bnot:
        return std::format("Bitwise.bnot({})",
                           expr(u.operand, printer::slot::argument));
      case unary_op::pre_increment:
      case unary_op::post_increment:
        return std::format("({} + 1)", operand);
      case unary_op::pre_decrement:
      case unary_op::post_decrement:
        return std::format("({} - 1)", operand);
    }
    throw internal_defect {"printer", "unknown unary operator", dump(x)};
  }

  std::string
  operator () (const field_node &f)
  {
    std::string object = expr(f.object, printer::slot::operand);
    if (not _is_postfix_safe(f.object))
      object = std::format("({})", object);
    return std::format("{}.{}", object, f.field);
  }

  std::string
  operator () (const access_node &a)
  {
    std::string object = expr(a.object, printer::slot::operand);
    if (not _is_postfix_safe(a.object))
      object = std::format("({})", object);
    return std::format("{}[{}]", object, expr(a.key, printer::slot::argument));
  }

  std::string
  operator () (const range_node &r)
  {
    const auto part = [&](node_ptr y) {
      const std::string text = expr(y, printer::slot::operand);
      return y->is<binary_node>() and not prints_as_call(y->get<binary_node>()->op)
          ? std::format("({})", text) : text;
    };
    std::string text = std::format("{}..{}", part(r.first), part(r.last));
    if (r.step)
      text += "//" + part(r.step);
    return where == printer::slot::operand ? std::format("({})", text) : text;
  }

  std::string
  operator () (const paren_node &p)
  { return std::format("({})", expr(p.inner)); }

  std::string
  operator () (const block_node &b)
  {
    if (b.statements.empty())
      return "nil";
    if (b.statements.size() == 1 and not _is_while(b.statements.front()))
      return self._expr(b.statements.front(), indent, where);
    return self._iife(x, indent);
  }

  std::string
  operator () (const match_node &m)
  {
    const std::string text = std::format("{} = {}", self.print_pattern(m.pattern),
                                         expr(m.value));
    return wrap(text);
  }

  std::string
  operator () (const assign_node &a)
  { return wrap(self._assign(a, indent)); }

  std::string
  operator () (const fn_node &f)
  {
    const std::string text = self._fn(f, indent);
    return where == printer::slot::operand ? std::format("({})", text) : text;
  }

  std::string
  operator () (const for_node &f)
  { return wrap(self._for(f, indent)); }
}; // struct alm::_printer_visitor


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                              entry points
std::string
printer::print(node_ptr x)
{
  if (const block_node *b = x->get<block_node>())
  {
    std::string text;
    for (size_t i = 0; i < b->statements.size(); ++i)
    {
      const node_ptr stmt = b->statements[i];
      if (i > 0)
      {
        const bool modules = stmt->is<module_node>() or
                             b->statements[i - 1]->is<module_node>();
        text += modules ? "\n\n" : "\n";
      }
      text += _statement(stmt, 0);
    }
    return text + "\n";
  }
  return _statement(x, 0) + "\n";
}

std::string
printer::print_expression(node_ptr x)
{ return _expr(x, 0); }

std::string
printer::print_pattern(pattern_ptr p)
{
  return std::visit([&]<typename T>(const T &x) -> std::string {
    if constexpr (std::same_as<T, var_pattern>)
      return std::string {x.name};
    else if constexpr (std::same_as<T, literal_pattern>)
      return _expr(x.value, 0);
    else if constexpr (std::same_as<T, tuple_pattern>)
      return std::format("{{{}}}", _patterns(x.elements));
    else if constexpr (std::same_as<T, list_pattern>)
      return std::format("[{}]", _patterns(x.elements));
    else if constexpr (std::same_as<T, cons_pattern>)
      return std::format("[{} | {}]", _patterns(x.heads), print_pattern(x.tail));
    else if constexpr (std::same_as<T, map_pattern>)
    {
      const bool atom_keys = std::ranges::all_of(x.entries, [](const auto &e) {
        return e.first->template is<atom_node>();
      });
      const std::string entries = _join(x.entries, ", ", [&](const auto &e) {
        if (atom_keys)
        {
          return std::format("{} {}", _keyword_key(e.first->template get<atom_node>()->name),
                             print_pattern(e.second));
        }
        return std::format("{} => {}", _expr(e.first, 0), print_pattern(e.second));
      });
      return std::format("%{{{}}}", entries);
    }
    else if constexpr (std::same_as<T, struct_pattern>)
    {
      const std::string fields = _join(x.fields, ", ", [&](const auto &f) {
        return std::format("{} {}", _keyword_key(f.first), print_pattern(f.second));
      });
      return std::format("%{}{{{}}}", x.module, fields);
    }
    else if constexpr (std::same_as<T, pin_pattern>)
      return std::format("^{}", x.name);
    else if constexpr (std::same_as<T, wildcard_pattern>)
      return "_";
    else
    {
      static_assert(std::same_as<T, bitstring_pattern>);
      const std::string segments = _join(x.segments, ", ", [&](const auto &s) {
        const std::string v = print_pattern(s.value);
        return s.spec.empty() ? v : std::format("{}::{}", v, s.spec);
      });
      return std::format("<<{}>>", segments);
    }
  }, p->data);
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                            statements and bodies
std::string
printer::_statements(node_ptr body, int indent)
{ return _ind(indent) + _statement(body, indent); }

std::string
printer::_statement(node_ptr x, int indent)
{
  if (const block_node *b = x->get<block_node>())
  {
    if (b->statements.empty())
      return "nil";
    return _join(b->statements, "\n" + _ind(indent), [&](node_ptr stmt) {
      return _statement(stmt, indent);
    });
  }

  if (_is_while(x))
  {
    const call_node &c = *x->get<call_node>();
    if (c.args.size() != 2)
      throw internal_defect {"printer", "malformed while-loop placeholder", dump(x)};
    return _while(c.args[0], c.args[1], indent);
  }

  return _expr(x, indent);
}

std::string
printer::_expr(node_ptr x, int indent, slot where)
{
  _printer_visitor visitor {*this, x, indent, where};
  return std::visit(visitor, x->data);
}

std::string
printer::_args(const node_list &args, int indent)
{
  return _join(args, ", ", [&](node_ptr arg) {
    return _expr(arg, indent, slot::argument);
  });
}

std::string
printer::_operand(node_ptr x, binary_op parent, bool left, int indent)
{
  const std::string text = _expr(x, indent, slot::operand);

  if (const binary_node *b = x->get<binary_node>();
      b and not prints_as_call(b->op))
  {
    const int child = precedence(b->op);
    const int self = precedence(parent);
    const bool wrong_side = is_right_associative(parent) ? left : not left;
    if (b->op == binary_op::sub or child < self or
        (child == self and wrong_side))
      return std::format("({})", text);
  }
  return text;
}

std::string
printer::_iife(node_ptr body, int indent)
{
  return std::format("(fn ->\n{}\n{}end).()", _statements(body, indent + 1),
                     _ind(indent));
}

std::string
printer::_while(node_ptr condition, node_ptr body, int indent)
{
  const std::string name = m_gensym();
  const std::string recur = std::format("{}.({})", name, name);

  std::string text = std::format("{} = fn {} ->\n", name, name);
  text += std::format("{}if {} do\n", _ind(indent + 1), _expr(condition, indent + 1));
  if (const block_node *b = body->get<block_node>(); not b or not b->statements.empty())
    text += _statements(body, indent + 2) + "\n";
  text += std::format("{}{}\n", _ind(indent + 2), recur);
  text += std::format("{}else\n{}:ok\n{}end\n", _ind(indent + 1), _ind(indent + 2),
                      _ind(indent + 1));
  text += std::format("{}end\n{}{}", _ind(indent), _ind(indent), recur);
  return text;
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                               definitions
std::string
printer::_module(const node &x, int indent)
{
  const module_node &m = *x.get<module_node>();
  const metadata &meta = meta_of(&x);

  utl::state_saver _ {m_exception_module};
  m_exception_module = meta.is_exception;

  node_list items;
  size_t pos = 0;
  for (; pos < m.body.size(); ++pos)
  {
    const attribute_node *a = m.body[pos]->get<attribute_node>();
    if (not a or a->name != "moduledoc")
      break;
    items.push_back(m.body[pos]);
  }
  if (not meta.unused_private_functions.empty())
  {
    keyword_node functions;
    for (const auto &[name, arity] : meta.unused_private_functions)
      functions.entries.emplace_back(name, int_lit(arity));
    const node_ptr suppression = tuple_of({atom("nowarn_unused_function"),
                                           make_node(std::move(functions))});
    items.push_back(make_node(attribute_node {"compile", suppression}));
  }
  items.insert(items.end(), m.body.begin() + pos, m.body.end());

  std::string body;
  for (size_t i = 0; i < items.size(); ++i)
  {
    if (i > 0)
    {
      const bool separate = items[i]->is<def_node>() or
                            items[i - 1]->is<def_node>() or
                            items[i - 1]->is<attribute_node>() !=
                                items[i]->is<attribute_node>();
      body += separate ? "\n\n" : "\n";
    }
    body += _ind(indent + 1) + _statement(items[i], indent + 1);
  }

  if (items.empty())
    return std::format("defmodule {} do\n{}end", m.name, _ind(indent));
  return std::format("defmodule {} do\n{}\n{}end", m.name, body, _ind(indent));
}

std::string
printer::_def(const def_node &x, int indent)
{
  std::string_view kind;
  switch (x.kind)
  {
    case def_kind::def: kind = "def"; break;
    case def_kind::defp: kind = "defp"; break;
    case def_kind::defmacro: kind = "defmacro"; break;
  }

  std::string head = std::format("{} {}", kind, x.name);
  if (not x.params.empty())
    head += std::format("({})", _patterns(x.params));
  if (x.guard)
    head += " when " + _expr(x.guard, indent);

  const block_node *b = x.body->get<block_node>();
  if (b and b->statements.empty())
    return head + ", do: nil";
  if (is_simple(x.body))
    return std::format("{}, do: {}", head, _expr(x.body, indent));
  return std::format("{} do\n{}\n{}end", head, _statements(x.body, indent + 1),
                     _ind(indent));
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                                  control
std::string
printer::_if(const node &x, int indent)
{
  const if_node &n = *x.get<if_node>();

  const auto single = [](node_ptr y) {
    return not y->is<block_node>() and not contains_assignment(y) and
           not _is_while(y);
  };
  bool inline_form = is_simple(n.condition) and is_simple(n.then_branch) and
                     (not n.else_branch or is_simple(n.else_branch));
  if (not inline_form and meta_of(&x).keep_inline)
  {
    inline_form = not n.condition->is<block_node>() and
                  not _is_while(n.condition) and single(n.then_branch) and
                  (not n.else_branch or single(n.else_branch));
  }

  if (inline_form)
  {
    std::string text = std::format("if {}, do: {}", _expr(n.condition, indent),
                                   _expr(n.then_branch, indent, slot::argument));
    if (n.else_branch)
      text += ", else: " + _expr(n.else_branch, indent, slot::argument);
    return text;
  }

  std::string text = std::format("if {} do\n{}", _expr(n.condition, indent),
                                 _statements(n.then_branch, indent + 1));
  if (n.else_branch)
  {
    text += std::format("\n{}else\n{}", _ind(indent),
                        _statements(n.else_branch, indent + 1));
  }
  return std::format("{}\n{}end", text, _ind(indent));
}

std::string
printer::_clauses(const clause_list &clauses, int indent)
{
  return _join(clauses, "\n", [&](const clause &c) {
    std::string head = print_pattern(c.pattern);
    if (c.guard)
      head += " when " + _expr(c.guard, indent + 1);
    return std::format("{}{} ->{}", _ind(indent + 1), head,
                       _clause_body(c.body, indent + 1));
  });
}

std::string
printer::_clause_body(node_ptr body, int indent)
{
  if (is_simple(body))
    return " " + _expr(body, indent);
  return "\n" + _statements(body, indent + 1);
}

std::string
printer::_try(const try_node &x, int indent)
{
  std::string text = std::format("try do\n{}", _statements(x.body, indent + 1));

  if (not x.rescues.empty())
  {
    text += std::format("\n{}rescue\n", _ind(indent));
    text += _join(x.rescues, "\n", [&](const auto &r) {
      std::string head;
      if (r.exceptions.empty())
        head = r.var.empty() ? "_" : std::string {r.var};
      else
      {
        const std::string var = r.var.empty() ? "_e" : std::string {r.var};
        const std::string exceptions = r.exceptions.size() == 1
            ? std::string {r.exceptions.front()}
            : std::format("[{}]", _join(r.exceptions, ", ", [](const auto &e) {
                return std::string {e};
              }));
        head = std::format("{} in {}", var, exceptions);
      }
      return std::format("{}{} ->{}", _ind(indent + 1), head,
                         _clause_body(r.body, indent + 1));
    });
  }

  if (not x.catches.empty())
  {
    text += std::format("\n{}catch\n", _ind(indent));
    text += _join(x.catches, "\n", [&](const auto &c) {
      std::string head = print_pattern(c.value);
      if (c.kind)
        head = std::format("{}, {}", print_pattern(c.kind), head);
      if (c.guard)
        head += " when " + _expr(c.guard, indent + 1);
      return std::format("{}{} ->{}", _ind(indent + 1), head,
                         _clause_body(c.body, indent + 1));
    });
  }

  if (not x.else_clauses.empty())
  {
    text += std::format("\n{}else\n{}", _ind(indent),
                        _clauses(x.else_clauses, indent));
  }

  if (x.after)
  {
    text += std::format("\n{}after\n{}", _ind(indent),
                        _statements(x.after, indent + 1));
  }

  return std::format("{}\n{}end", text, _ind(indent));
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                                   data
std::string
printer::_map(const map_node &x, int indent)
{
  const bool atom_keys = std::ranges::all_of(x.entries, [](const auto &e) {
    return e.first->template is<atom_node>();
  });

  const std::string entries = _join(x.entries, ", ", [&](const auto &e) {
    const std::string v = _expr(e.second, indent, slot::map_value);
    if (atom_keys)
      return std::format("{} {}", _keyword_key(e.first->template get<atom_node>()->name), v);
    return std::format("{} => {}", _expr(e.first, indent, slot::argument), v);
  });

  if (x.base)
    return std::format("%{{{} | {}}}", _expr(x.base, indent), entries);
  return std::format("%{{{}}}", entries);
}

std::string
printer::_fields(const stl::vector<std::pair<stl::string, node_ptr>> &fields,
                 int indent)
{
  return _join(fields, ", ", [&](const auto &f) {
    return std::format("{} {}", _keyword_key(f.first),
                       _expr(f.second, indent, slot::map_value));
  });
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                                  binding
std::string
printer::_fn(const fn_node &x, int indent)
{
  const auto head = [&](const fn_node::fn_clause &c) {
    std::string text = _patterns(c.params);
    if (c.guard)
      text += " when " + _expr(c.guard, indent + 1);
    return text;
  };

  if (x.clauses.size() == 1)
  {
    const fn_node::fn_clause &c = x.clauses.front();
    std::string text = head(c);
    text = text.empty() ? "fn ->" : std::format("fn {} ->", text);
    if (is_simple(c.body))
      return std::format("{} {} end", text, _expr(c.body, indent));
    return std::format("{}\n{}\n{}end", text, _statements(c.body, indent + 1),
                       _ind(indent));
  }

  const std::string clauses = _join(x.clauses, "\n", [&](const auto &c) {
    return std::format("{}{} ->{}", _ind(indent + 1), head(c),
                       _clause_body(c.body, indent + 1));
  });
  return std::format("fn\n{}\n{}end", clauses, _ind(indent));
}

std::string
printer::_for(const for_node &x, int indent)
{
  std::string head = "for " + _join(x.generators, ", ", [&](const auto &g) {
    return std::format("{} <- {}", print_pattern(g.pattern),
                       _expr(g.source, indent, slot::argument));
  });
  for (const node_ptr filter : x.filters)
    head += ", " + _expr(filter, indent, slot::argument);
  if (x.into)
    head += ", into: " + _expr(x.into, indent, slot::argument);

  if (is_simple(x.body))
    return std::format("{}, do: {}", head, _expr(x.body, indent, slot::argument));
  return std::format("{} do\n{}\n{}end", head, _statements(x.body, indent + 1),
                     _ind(indent));
}

std::string
printer::_assign(const assign_node &x, int indent)
{
  // Path from the root variable to the assigned location, outermost first
  stl::vector<node_ptr> path;
  node_ptr root = x.target;
  for (;;)
  {
    if (const field_node *f = root->get<field_node>())
      path.push_back(root), root = f->object;
    else if (const access_node *a = root->get<access_node>())
      path.push_back(root), root = a->object;
    else
      break;
  }
  std::ranges::reverse(path);

  const std::optional<std::string_view> name = var_name(root);
  if (not name)
  {
    throw internal_defect {"printer",
                           "imperative assignment without a root variable",
                           dump(x.target)};
  }

  // Rebuild the updated value from the innermost location outwards
  std::string value = _expr(x.value, indent);
  for (size_t i = path.size(); i-- > 0;)
  {
    const node_ptr container = i == 0 ? root : path[i - 1];
    const std::string object = _expr(container, indent, slot::operand);
    if (const field_node *f = path[i]->get<field_node>())
      value = std::format("%{{{} | {} {}}}", object, _keyword_key(f->field), value);
    else
    {
      const access_node &a = *path[i]->get<access_node>();
      value = std::format("Map.put({}, {}, {})", object,
                          _expr(a.key, indent, slot::argument), value);
    }
  }
  return std::format("{} = {}", *name, value);
}

std::string
printer::_patterns(const pattern_list &ps)
{ return _join(ps, ", ", [&](pattern_ptr p) { return print_pattern(p); }); }

} // namespace alm
