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


#include "alembic/ast/traversal.hpp"


namespace alm::ast {

namespace {

// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                               child visitor
struct _child_visitor {
  const child_visitor &fn;
  const pattern_visitor &pfn;

  void
  child(node_ptr x, child_role role)
  {
    if (x)
      fn(x, role);
  }

  void
  children(const node_list &xs, child_role role)
  {
    for (const node_ptr x : xs)
      child(x, role);
  }

  void
  pat(pattern_ptr p)
  {
    if (p and pfn)
      pfn(p);
  }

  void
  clauses(const clause_list &cs)
  {
    for (const clause &c : cs)
    {
      pat(c.pattern);
      child(c.guard, child_role::guard);
      child(c.body, child_role::body);
    }
  }

  void operator () (const var_node &) { }
  void operator () (const literal_node &) { }
  void operator () (const atom_node &) { }
  void operator () (const nil_node &) { }
  void operator () (const underscore_node &) { }
  void operator () (const alias_node &) { }
  void operator () (const raw_node &) { }

  void
  operator () (const module_node &x)
  { children(x.body, child_role::statement); }

  void
  operator () (const def_node &x)
  {
    for (const pattern_ptr p : x.params)
      pat(p);
    child(x.guard, child_role::guard);
    child(x.body, child_role::body);
  }

  void
  operator () (const attribute_node &x)
  { child(x.value, child_role::other); }

  void
  operator () (const directive_node &x)
  { child(x.options, child_role::other); }

  void
  operator () (const if_node &x)
  {
    child(x.condition, child_role::condition);
    child(x.then_branch, child_role::branch);
    child(x.else_branch, child_role::branch);
  }

  void
  operator () (const case_node &x)
  {
    child(x.subject, child_role::subject);
    clauses(x.clauses);
  }

  void
  operator () (const cond_node &x)
  {
    for (const auto &b : x.branches)
    {
      child(b.condition, child_role::condition);
      child(b.body, child_role::branch);
    }
  }

  void
  operator () (const try_node &x)
  {
    child(x.body, child_role::body);
    for (const auto &r : x.rescues)
      child(r.body, child_role::body);
    for (const auto &c : x.catches)
    {
      pat(c.kind);
      pat(c.value);
      child(c.guard, child_role::guard);
      child(c.body, child_role::body);
    }
    clauses(x.else_clauses);
    child(x.after, child_role::body);
  }

  void
  operator () (const with_node &x)
  {
    for (const auto &b : x.bindings)
    {
      pat(b.pattern);
      child(b.value, child_role::other);
    }
    child(x.body, child_role::body);
    clauses(x.else_clauses);
  }

  void
  operator () (const receive_node &x)
  {
    clauses(x.clauses);
    child(x.timeout, child_role::other);
    child(x.after_body, child_role::body);
  }

  void
  operator () (const list_node &x)
  {
    children(x.elements, child_role::element);
    child(x.tail, child_role::element);
  }

  void
  operator () (const tuple_node &x)
  { children(x.elements, child_role::element); }

  void
  operator () (const map_node &x)
  {
    child(x.base, child_role::other);
    for (const auto &[k, v] : x.entries)
    {
      child(k, child_role::map_key);
      child(v, child_role::map_value);
    }
  }

  void
  operator () (const keyword_node &x)
  {
    for (const auto &[_, v] : x.entries)
      child(v, child_role::map_value);
  }

  void
  operator () (const struct_node &x)
  {
    child(x.base, child_role::other);
    for (const auto &[_, v] : x.fields)
      child(v, child_role::map_value);
  }

  void
  operator () (const bitstring_node &x)
  {
    for (const auto &s : x.segments)
      child(s.value, child_role::element);
  }

  void
  operator () (const call_node &x)
  { children(x.args, child_role::argument); }

  void
  operator () (const remote_call_node &x)
  {
    child(x.target, child_role::target);
    children(x.args, child_role::argument);
  }

  void
  operator () (const apply_node &x)
  {
    child(x.function, child_role::target);
    children(x.args, child_role::argument);
  }

  void
  operator () (const binary_node &x)
  {
    child(x.lhs, child_role::operand);
    child(x.rhs, child_role::operand);
  }

  void
  operator () (const unary_node &x)
  { child(x.operand, child_role::operand); }

  void
  operator () (const field_node &x)
  { child(x.object, child_role::operand); }

  void
  operator () (const access_node &x)
  {
    child(x.object, child_role::operand);
    child(x.key, child_role::operand);
  }

  void
  operator () (const range_node &x)
  {
    child(x.first, child_role::operand);
    child(x.last, child_role::operand);
    child(x.step, child_role::operand);
  }

  void
  operator () (const paren_node &x)
  { child(x.inner, child_role::paren); }

  void
  operator () (const block_node &x)
  { children(x.statements, child_role::statement); }

  void
  operator () (const match_node &x)
  {
    pat(x.pattern);
    child(x.value, child_role::match_rhs);
  }

  void
  operator () (const assign_node &x)
  {
    child(x.target, child_role::target);
    child(x.value, child_role::match_rhs);
  }

  void
  operator () (const fn_node &x)
  {
    for (const auto &c : x.clauses)
    {
      for (const pattern_ptr p : c.params)
        pat(p);
      child(c.guard, child_role::guard);
      child(c.body, child_role::body);
    }
  }

  void
  operator () (const for_node &x)
  {
    for (const auto &g : x.generators)
    {
      pat(g.pattern);
      child(g.source, child_role::other);
    }
    children(x.filters, child_role::condition);
    child(x.into, child_role::other);
    child(x.body, child_role::body);
  }
}; // struct _child_visitor


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                                 rebuilder
struct _rebuilder {
  node_ptr self;
  const child_rewriter &fn;
  const pattern_rewriter &pfn;
  bool changed = false;

  node_ptr
  child(node_ptr x, child_role role)
  {
    if (x == nullptr)
      return nullptr;
    const node_ptr y = fn(x, role);
    changed |= (y != x);
    return y;
  }

  node_list
  children(const node_list &xs, child_role role)
  {
    node_list ys;
    ys.reserve(xs.size());
    for (const node_ptr x : xs)
      ys.push_back(child(x, role));
    return ys;
  }

  pattern_ptr
  pat(pattern_ptr p)
  {
    if (p == nullptr or not pfn)
      return p;
    const pattern_ptr q = pfn(p);
    changed |= (q != p);
    return q;
  }

  pattern_list
  pats(const pattern_list &ps)
  {
    pattern_list qs;
    qs.reserve(ps.size());
    for (const pattern_ptr p : ps)
      qs.push_back(pat(p));
    return qs;
  }

  clause_list
  clauses(const clause_list &cs)
  {
    clause_list result;
    result.reserve(cs.size());
    for (const clause &c : cs)
    {
      result.push_back({pat(c.pattern),
                        child(c.guard, child_role::guard),
                        child(c.body, child_role::body)});
    }
    return result;
  }

  template <typename T>
  node_ptr
  result(T &&alt)
  { return changed ? make_node(std::forward<T>(alt), self->meta) : self; }

  node_ptr operator () (const var_node &) { return self; }
  node_ptr operator () (const literal_node &) { return self; }
  node_ptr operator () (const atom_node &) { return self; }
  node_ptr operator () (const nil_node &) { return self; }
  node_ptr operator () (const underscore_node &) { return self; }
  node_ptr operator () (const alias_node &) { return self; }
  node_ptr operator () (const raw_node &) { return self; }

  node_ptr
  operator () (const module_node &x)
  { return result(module_node {x.name, children(x.body, child_role::statement)}); }

  node_ptr
  operator () (const def_node &x)
  {
    return result(def_node {x.kind, x.name, pats(x.params),
                            child(x.guard, child_role::guard),
                            child(x.body, child_role::body)});
  }

  node_ptr
  operator () (const attribute_node &x)
  { return result(attribute_node {x.name, child(x.value, child_role::other)}); }

  node_ptr
  operator () (const directive_node &x)
  {
    return result(directive_node {x.kind, x.module,
                                  child(x.options, child_role::other)});
  }

  node_ptr
  operator () (const if_node &x)
  {
    return result(if_node {child(x.condition, child_role::condition),
                           child(x.then_branch, child_role::branch),
                           child(x.else_branch, child_role::branch)});
  }

  node_ptr
  operator () (const case_node &x)
  {
    const node_ptr subject = child(x.subject, child_role::subject);
    return result(case_node {subject, clauses(x.clauses)});
  }

  node_ptr
  operator () (const cond_node &x)
  {
    cond_node y;
    for (const auto &b : x.branches)
    {
      y.branches.push_back({child(b.condition, child_role::condition),
                            child(b.body, child_role::branch)});
    }
    return result(std::move(y));
  }

  node_ptr
  operator () (const try_node &x)
  {
    try_node y;
    y.body = child(x.body, child_role::body);
    for (const auto &r : x.rescues)
      y.rescues.push_back({r.exceptions, r.var, child(r.body, child_role::body)});
    for (const auto &c : x.catches)
    {
      y.catches.push_back({pat(c.kind), pat(c.value),
                           child(c.guard, child_role::guard),
                           child(c.body, child_role::body)});
    }
    y.else_clauses = clauses(x.else_clauses);
    y.after = child(x.after, child_role::body);
    return result(std::move(y));
  }

  node_ptr
  operator () (const with_node &x)
  {
    with_node y;
    for (const auto &b : x.bindings)
      y.bindings.push_back({pat(b.pattern), child(b.value, child_role::other)});
    y.body = child(x.body, child_role::body);
    y.else_clauses = clauses(x.else_clauses);
    return result(std::move(y));
  }

  node_ptr
  operator () (const receive_node &x)
  {
    receive_node y;
    y.clauses = clauses(x.clauses);
    y.timeout = child(x.timeout, child_role::other);
    y.after_body = child(x.after_body, child_role::body);
    return result(std::move(y));
  }

  node_ptr
  operator () (const list_node &x)
  {
    node_list elements = children(x.elements, child_role::element);
    const node_ptr tail = child(x.tail, child_role::element);
    return result(list_node {std::move(elements), tail});
  }

  node_ptr
  operator () (const tuple_node &x)
  { return result(tuple_node {children(x.elements, child_role::element)}); }

  node_ptr
  operator () (const map_node &x)
  {
    map_node y;
    y.base = child(x.base, child_role::other);
    for (const auto &[k, v] : x.entries)
    {
      const node_ptr newk = child(k, child_role::map_key);
      y.entries.emplace_back(newk, child(v, child_role::map_value));
    }
    return result(std::move(y));
  }

  node_ptr
  operator () (const keyword_node &x)
  {
    keyword_node y;
    for (const auto &[k, v] : x.entries)
      y.entries.emplace_back(k, child(v, child_role::map_value));
    return result(std::move(y));
  }

  node_ptr
  operator () (const struct_node &x)
  {
    struct_node y {x.module, child(x.base, child_role::other), { }};
    for (const auto &[k, v] : x.fields)
      y.fields.emplace_back(k, child(v, child_role::map_value));
    return result(std::move(y));
  }

  node_ptr
  operator () (const bitstring_node &x)
  {
    bitstring_node y;
    for (const auto &s : x.segments)
      y.segments.push_back({child(s.value, child_role::element), s.spec});
    return result(std::move(y));
  }

  node_ptr
  operator () (const call_node &x)
  { return result(call_node {x.name, children(x.args, child_role::argument)}); }

  node_ptr
  operator () (const remote_call_node &x)
  {
    const node_ptr target = child(x.target, child_role::target);
    return result(remote_call_node {target, x.name,
                                    children(x.args, child_role::argument)});
  }

  node_ptr
  operator () (const apply_node &x)
  {
    const node_ptr function = child(x.function, child_role::target);
    return result(apply_node {function, children(x.args, child_role::argument)});
  }

  node_ptr
  operator () (const binary_node &x)
  {
    const node_ptr lhs = child(x.lhs, child_role::operand);
    const node_ptr rhs = child(x.rhs, child_role::operand);
    return result(binary_node {x.op, lhs, rhs});
  }

  node_ptr
  operator () (const unary_node &x)
  { return result(unary_node {x.op, child(x.operand, child_role::operand)}); }

  node_ptr
  operator () (const field_node &x)
  { return result(field_node {child(x.object, child_role::operand), x.field}); }

  node_ptr
  operator () (const access_node &x)
  {
    const node_ptr object = child(x.object, child_role::operand);
    const node_ptr key = child(x.key, child_role::operand);
    return result(access_node {object, key});
  }

  node_ptr
  operator () (const range_node &x)
  {
    const node_ptr first = child(x.first, child_role::operand);
    const node_ptr last = child(x.last, child_role::operand);
    const node_ptr step = child(x.step, child_role::operand);
    return result(range_node {first, last, step});
  }

  node_ptr
  operator () (const paren_node &x)
  { return result(paren_node {child(x.inner, child_role::paren)}); }

  node_ptr
  operator () (const block_node &x)
  { return result(block_node {children(x.statements, child_role::statement)}); }

  node_ptr
  operator () (const match_node &x)
  {
    const pattern_ptr pattern = pat(x.pattern);
    return result(match_node {pattern, child(x.value, child_role::match_rhs)});
  }

  node_ptr
  operator () (const assign_node &x)
  {
    const node_ptr target = child(x.target, child_role::target);
    return result(assign_node {target, child(x.value, child_role::match_rhs)});
  }

  node_ptr
  operator () (const fn_node &x)
  {
    fn_node y;
    for (const auto &c : x.clauses)
    {
      pattern_list params = pats(c.params);
      const node_ptr guard = child(c.guard, child_role::guard);
      y.clauses.push_back({std::move(params), guard,
                           child(c.body, child_role::body)});
    }
    return result(std::move(y));
  }

  node_ptr
  operator () (const for_node &x)
  {
    for_node y;
    for (const auto &g : x.generators)
    {
      const pattern_ptr p = pat(g.pattern);
      y.generators.push_back({p, child(g.source, child_role::other)});
    }
    y.filters = children(x.filters, child_role::condition);
    y.into = child(x.into, child_role::other);
    y.body = child(x.body, child_role::body);
    return result(std::move(y));
  }
}; // struct _rebuilder

} // anonymous namespace


void
for_each_child(node_ptr x, const child_visitor &fn, const pattern_visitor &pfn)
{
  _child_visitor visitor {fn, pfn};
  std::visit(visitor, x->data);
}

node_ptr
rebuild(node_ptr x, const child_rewriter &fn, const pattern_rewriter &pfn)
{
  _rebuilder rebuilder {x, fn, pfn};
  return std::visit(rebuilder, x->data);
}

node_ptr
rewrite(node_ptr x, const std::function<node_ptr(node_ptr)> &transformer)
{
  if (x->is<raw_node>())
    return x;

  const node_ptr rebuilt = rebuild(x, [&](node_ptr child, child_role) {
    return rewrite(child, transformer);
  });
  return transformer(rebuilt);
}

void
walk(node_ptr x, const std::function<bool(node_ptr)> &fn)
{
  if (fn(x))
    for_each_child(x, [&](node_ptr child, child_role) { walk(child, fn); });
}


node_ptr
expand_statements(node_ptr x, const std::function<node_list(node_ptr)> &fn)
{
  if (x->is<raw_node>())
    return x;

  const node_ptr y = rebuild(x, [&](node_ptr child, child_role role) {
    const node_ptr c = expand_statements(child, fn);
    if ((role == child_role::body or role == child_role::branch) and
        not c->is<block_node>())
    {
      node_list statements = fn(c);
      if (statements.size() == 1)
        return inherit_meta(statements.front(), c);
      return make_node(block_node {std::move(statements)}, c->meta);
    }
    return c;
  });

  if (const block_node *b = y->get<block_node>())
  {
    node_list statements;
    bool changed = false;
    for (const node_ptr stmt : b->statements)
    {
      const node_list expanded = fn(stmt);
      changed |= expanded.size() != 1 or expanded.front() != stmt;
      statements.insert(statements.end(), expanded.begin(), expanded.end());
    }
    if (changed)
      return make_node(block_node {std::move(statements)}, y->meta);
  }
  return y;
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                                 patterns
void
for_each_subpattern(pattern_ptr p, const pattern_visitor &fn)
{
  std::visit([&]<typename T>(const T &x) {
    if constexpr (std::same_as<T, tuple_pattern> or
                  std::same_as<T, list_pattern>)
    {
      for (const pattern_ptr q : x.elements)
        fn(q);
    }
    else if constexpr (std::same_as<T, cons_pattern>)
    {
      for (const pattern_ptr q : x.heads)
        fn(q);
      fn(x.tail);
    }
    else if constexpr (std::same_as<T, map_pattern> or
                       std::same_as<T, struct_pattern>)
    {
      const auto &entries = [&]() -> const auto& {
        if constexpr (std::same_as<T, map_pattern>)
          return x.entries;
        else
          return x.fields;
      }();
      for (const auto &[_, q] : entries)
        fn(q);
    }
    else if constexpr (std::same_as<T, bitstring_pattern>)
    {
      for (const auto &s : x.segments)
        fn(s.value);
    }
    else
      static_assert(std::same_as<T, var_pattern> or
                    std::same_as<T, literal_pattern> or
                    std::same_as<T, pin_pattern> or
                    std::same_as<T, wildcard_pattern>);
  }, p->data);
}


pattern_ptr
rewrite_pattern(pattern_ptr p, const pattern_rewriter &fn)
{
  bool changed = false;
  auto sub = [&](pattern_ptr q) {
    const pattern_ptr r = rewrite_pattern(q, fn);
    changed |= (r != q);
    return r;
  };
  auto subs = [&](const pattern_list &qs) {
    pattern_list rs;
    for (const pattern_ptr q : qs)
      rs.push_back(sub(q));
    return rs;
  };

  const pattern_ptr rebuilt = std::visit([&]<typename T>(const T &x) -> pattern_ptr {
    if constexpr (std::same_as<T, tuple_pattern>)
    {
      tuple_pattern y {subs(x.elements)};
      return changed ? make_pattern(std::move(y)) : p;
    }
    else if constexpr (std::same_as<T, list_pattern>)
    {
      list_pattern y {subs(x.elements)};
      return changed ? make_pattern(std::move(y)) : p;
    }
    else if constexpr (std::same_as<T, cons_pattern>)
    {
      pattern_list heads = subs(x.heads);
      cons_pattern y {std::move(heads), sub(x.tail)};
      return changed ? make_pattern(std::move(y)) : p;
    }
    else if constexpr (std::same_as<T, map_pattern>)
    {
      map_pattern y;
      for (const auto &[k, q] : x.entries)
        y.entries.emplace_back(k, sub(q));
      return changed ? make_pattern(std::move(y)) : p;
    }
    else if constexpr (std::same_as<T, struct_pattern>)
    {
      struct_pattern y {x.module, { }};
      for (const auto &[k, q] : x.fields)
        y.fields.emplace_back(k, sub(q));
      return changed ? make_pattern(std::move(y)) : p;
    }
    else if constexpr (std::same_as<T, bitstring_pattern>)
    {
      bitstring_pattern y;
      for (const auto &s : x.segments)
        y.segments.push_back({sub(s.value), s.spec});
      return changed ? make_pattern(std::move(y)) : p;
    }
    else
    {
      static_assert(std::same_as<T, var_pattern> or
                    std::same_as<T, literal_pattern> or
                    std::same_as<T, pin_pattern> or
                    std::same_as<T, wildcard_pattern>);
      return p;
    }
  }, p->data);

  return fn(rebuilt);
}


stl::vector<stl::string>
pattern_variables(pattern_ptr p)
{
  stl::vector<stl::string> result;
  std::function<void(pattern_ptr)> collect = [&](pattern_ptr q) {
    if (const var_pattern *v = q->get<var_pattern>())
      result.push_back(v->name);
    else
      for_each_subpattern(q, collect);
  };
  collect(p);
  return result;
}

} // namespace alm::ast
