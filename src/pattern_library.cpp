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


#include "alembic/typed/pattern_library.hpp"
#include "alembic/typed/forms.hpp"
#include "alembic/ast/analysis.hpp"
#include "alembic/ast/construct.hpp"
#include "alembic/logging.hpp"
#include "alembic/sexpr_parser.hpp"


namespace alm::typed {

using namespace alm::ast;

static long
_id(value x)
{ return static_cast<long>(num_val(x)); }

static pattern_ptr
_pvar(const pattern_context &ctx, value name, long id)
{ return make_pattern(var_pattern {stl::string {ctx.name(sym_name(name))}, id}); }

static node_ptr
_inline(node_ptr x)
{
  metadata meta = meta_of(x);
  meta.keep_inline = true;
  return with_meta(x, meta);
}

/** True if a `(local _ id _)` form occurs anywhere in \p x */
static bool
_references(value x, value id)
{
  if (not ispair(x))
    return false;
  if (is_form(x, "local") and ispair(operands(x)) and
      equal(car(operands(x)), id))
    return true;
  for (; ispair(x); x = cdr(x))
  {
    if (_references(car(x), id))
      return true;
  }
  return false;
}

static bool
_is_comparison(value op) noexcept
{
  return issym(op, "==") or issym(op, "!=") or issym(op, "<") or
         issym(op, "<=") or issym(op, ">") or issym(op, ">=");
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                             inlined accessor
const match&
inlined_accessor::matcher()
{
  static const match m {
    "(block var if binop local const)"_sexpr,
    "(block _ (var _ id tmp init)"
    "         (if _ (binop _ op (local _ id tmp) (const _ ())) a b))"_sexpr
  };
  return m;
}

bool
inlined_accessor::accepts(const match_mapping &ms)
{
  const value op = ms.at("op");
  return isnum(ms.at("id")) and issym(ms.at("tmp")) and
         (issym(op, "==") or issym(op, "!="));
}

inlined_accessor::fields
inlined_accessor::read(const match_mapping &ms)
{
  return {
    _id(ms.at("id")), ms.at("tmp"), ms.at("init"),
    issym(ms.at("op"), "=="),
    ms.at("a"), ms.at("b")
  };
}

/** Null-guarded access with \p init already lowered */
static node_ptr
_guarded_access(const inlined_accessor::fields &f, node_ptr init,
                const pattern_context &ctx)
{
  const std::string temp = ctx.name(sym_name(f.temp));
  node_ptr when_true = ctx.build(f.when_true);
  node_ptr when_false = ctx.build(f.when_false);
  const binary_op op = f.tests_null ? binary_op::eq : binary_op::neq;

  if (is_pure(init))
  {
    when_true = substitute(when_true, temp, init);
    when_false = substitute(when_false, temp, init);
    return _inline(if_(binary(op, init, nil_lit()), when_true, when_false));
  }

  const node_ptr test = binary(op, paren(bind(_pvar(ctx, f.temp, f.id), init)),
                               nil_lit());
  return _inline(if_(test, when_true, when_false));
}

node_ptr
inlined_accessor::transform(const fields &f, const pattern_context &ctx)
{ return _guarded_access(f, ctx.build(f.init), ctx); }


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                           multi-temp accessor
const match&
multi_temp_accessor::matcher()
{
  static const match m {
    "(block var if binop local const)"_sexpr,
    "(block _ (var _ id1 t1 init1) (var _ id2 t2 init2)"
    "  (binop _ cmp"
    "    (if _ (binop _ op1 (local _ id1 t1) (const _ ())) a1 b1)"
    "    (if _ (binop _ op2 (local _ id2 t2) (const _ ())) a2 b2)))"_sexpr
  };
  return m;
}

bool
multi_temp_accessor::accepts(const match_mapping &ms)
{
  const auto null_test = [](value op) {
    return issym(op, "==") or issym(op, "!=");
  };
  const value id1 = ms.at("id1"), id2 = ms.at("id2");
  return isnum(id1) and isnum(id2) and not equal(id1, id2) and
         issym(ms.at("t1")) and issym(ms.at("t2")) and
         _is_comparison(ms.at("cmp")) and
         null_test(ms.at("op1")) and null_test(ms.at("op2")) and
         not _references(ms.at("init2"), id1);
}

multi_temp_accessor::fields
multi_temp_accessor::read(const match_mapping &ms)
{
  return {
    {_id(ms.at("id1")), ms.at("t1"), ms.at("init1"), issym(ms.at("op1"), "=="),
     ms.at("a1"), ms.at("b1")},
    {_id(ms.at("id2")), ms.at("t2"), ms.at("init2"), issym(ms.at("op2"), "=="),
     ms.at("a2"), ms.at("b2")},
    ms.at("cmp")
  };
}

node_ptr
multi_temp_accessor::transform(const fields &f, const pattern_context &ctx)
{
  const node_ptr lowered =
    ctx.build(list("binop", "Bool", f.comparison, list("const", "Int", 0),
                   list("const", "Int", 0)));
  const binary_node *cmp = lowered->get<binary_node>();
  if (not cmp)
  {
    throw internal_defect {name, "comparison did not lower to an operator",
                           std::format("{}", f.comparison)};
  }

  const node_ptr init1 = ctx.build(f.first.init);
  const node_ptr init2 = ctx.build(f.second.init);
  const node_ptr lhs = _guarded_access(f.first, init1, ctx);

  // The second initializer runs after the first guard unless that guard's
  // branches may have effects of their own
  const if_node *first = lhs->get<if_node>();
  const bool ordered = is_pure(init2) or
                       (is_pure(first->then_branch) and
                        is_pure(first->else_branch));
  if (ordered)
    return binary(cmp->op, lhs, _guarded_access(f.second, init2, ctx));

  const std::string t1 = ctx.name(sym_name(f.first.temp));
  const std::string t2 = ctx.name(sym_name(f.second.temp));
  const node_ptr access1 = _guarded_access(f.first, var(t1, f.first.id), ctx);
  const node_ptr access2 = _guarded_access(f.second, var(t2, f.second.id), ctx);
  return block({
    bind(_pvar(ctx, f.first.temp, f.first.id), init1),
    bind(_pvar(ctx, f.second.temp, f.second.id), init2),
    binary(cmp->op, access1, access2)
  });
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                             null coalescing
const match&
null_coalescing::matcher()
{
  static const match m {
    "(block var binop ?? local)"_sexpr,
    "(block _ (var _ id tmp init) (binop _ ?? (local _ id tmp) fallback))"_sexpr
  };
  return m;
}

bool
null_coalescing::accepts(const match_mapping &ms)
{ return isnum(ms.at("id")) and issym(ms.at("tmp")); }

null_coalescing::fields
null_coalescing::read(const match_mapping &ms)
{
  return {_id(ms.at("id")), ms.at("tmp"), ms.at("init"), ms.at("fallback")};
}

node_ptr
null_coalescing::transform(const fields &f, const pattern_context &ctx)
{
  const node_ptr init = ctx.build(f.init);
  const node_ptr fallback = ctx.build(f.fallback);
  if (is_pure(init))
    return _inline(if_(binary(binary_op::neq, init, nil_lit()), init, fallback));

  const std::string temp = ctx.name(sym_name(f.temp));
  const node_ptr test =
    binary(binary_op::neq, paren(bind(_pvar(ctx, f.temp, f.id), init)),
           nil_lit());
  return _inline(if_(test, var(temp, f.id), fallback));
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                         unrolled collection loop
const match&
unrolled_collection_loop::matcher()
{
  static const match m {
    "(block var array const while binop < local field length index unop ++)"_sexpr,
    "(block _"
    "  (var _ rid res (array _))"
    "  (var _ iid idx (const _ 0))"
    "  (while _ (binop _ < (local _ iid idx) (field _ arr length))"
    "    (block _"
    "      (var _ eid elem (index _ arr (local _ iid idx)))"
    "      (unop _ ++ fix (local _ iid idx))"
    "      step))"
    "  (local _ rid res))"_sexpr
  };
  return m;
}

/** Value pushed onto the result by \p step, and the filter guarding it */
static std::optional<std::pair<value, std::optional<value>>>
_pushed(value step, value rid)
{
  static const match push {
    "(call field local push)"_sexpr,
    "(call _ (field _ (local _ rid _) push) e)"_sexpr
  };
  static const match guarded {"(if)"_sexpr, "(if _ cond then)"_sexpr};

  match_mapping ms;
  std::optional<value> condition;
  if (guarded(step, ms))
  {
    condition = ms.at("cond");
    step = ms.at("then");
    ms.clear();
  }
  if (not push(step, ms) or not equal(ms.at("rid"), rid))
    return std::nullopt;
  return std::make_pair(ms.at("e"), condition);
}

bool
unrolled_collection_loop::accepts(const match_mapping &ms)
{
  const value rid = ms.at("rid"), iid = ms.at("iid");
  if (not isnum(ms.at("eid")) or not issym(ms.at("elem")))
    return false;
  const auto pushed = _pushed(ms.at("step"), rid);
  if (not pushed)
    return false;

  const auto [e, condition] = *pushed;
  const auto uses_loop_state = [&](value x) {
    return _references(x, iid) or _references(x, rid);
  };
  return not uses_loop_state(e) and
         not (condition and uses_loop_state(*condition)) and
         not _references(ms.at("arr"), iid);
}

unrolled_collection_loop::fields
unrolled_collection_loop::read(const match_mapping &ms)
{
  const auto pushed = _pushed(ms.at("step"), ms.at("rid"));
  if (not pushed)
  {
    throw internal_defect {name, "no append step",
                           std::format("{}", ms.at("step"))};
  }
  return {
    _id(ms.at("eid")), ms.at("elem"), ms.at("arr"),
    pushed->second, pushed->first
  };
}

node_ptr
unrolled_collection_loop::transform(const fields &f, const pattern_context &ctx)
{
  for_node loop;
  loop.generators.push_back({_pvar(ctx, f.element, f.element_id),
                             ctx.build(f.collection)});
  if (f.condition)
    loop.filters.push_back(ctx.build(*f.condition));
  loop.body = ctx.build(f.body);
  return make_node(std::move(loop));
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                            iterator protocol
const match&
iterator_protocol::matcher()
{
  static const match m {
    "(block var call field keyValueIterator while hasNext next key value"
    " local)"_sexpr,
    "(block _"
    "  (var _ iid it (call _ (field _ coll keyValueIterator)))"
    "  (while _ (call _ (field _ (local _ iid it) hasNext))"
    "    (block _"
    "      (var _ gid g (call _ (field _ (local _ iid it) next)))"
    "      (var _ kid k (field _ (local _ gid g) key))"
    "      (var _ vid v (field _ (local _ gid g) value))"
    "      body ...)))"_sexpr
  };
  return m;
}

bool
iterator_protocol::accepts(const match_mapping &ms)
{
  return isnum(ms.at("kid")) and isnum(ms.at("vid")) and
         issym(ms.at("k")) and issym(ms.at("v")) and
         not _references(ms.at("body"), ms.at("iid")) and
         not _references(ms.at("body"), ms.at("gid"));
}

iterator_protocol::fields
iterator_protocol::read(const match_mapping &ms)
{
  return {
    ms.at("coll"),
    _id(ms.at("kid")), _id(ms.at("vid")),
    ms.at("k"), ms.at("v"),
    ms.at("body")
  };
}

node_ptr
iterator_protocol::transform(const fields &f, const pattern_context &ctx)
{
  const pattern_ptr entry = ptuple({_pvar(ctx, f.key, f.key_id),
                                    _pvar(ctx, f.value_name, f.value_id)});
  const node_ptr body = ctx.build(cons("block", cons("Void", f.body)));
  return remote("Enum", "each", {ctx.build(f.collection), lambda({entry}, body)});
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                                 dispatch
template <idiom P>
static node_ptr
_lower(value x, const pattern_context &ctx)
{
  if (not is<P>(x))
    return nullptr;

  const std::optional<typename P::fields> f = extract<P>(x);
  if (not f)
  {
    throw internal_defect {P::name, "extractor rejected a detected form",
                           std::format("{}", x)};
  }
  debug("lower idiom \e[1m{}\e[0m", P::name);
  return transform<P>(*f, ctx);
}

node_ptr
lower_idiom(value x, const pattern_context &ctx)
{
  if (not is_form(x, "block"))
    return nullptr;

  using lowering = node_ptr (*)(value, const pattern_context&);
  static constexpr lowering lowerings[] {
    _lower<unrolled_collection_loop>,
    _lower<iterator_protocol>,
    _lower<inlined_accessor>,
    _lower<null_coalescing>,
    _lower<multi_temp_accessor>,
  };

  for (const lowering lower : lowerings)
  {
    if (const node_ptr result = lower(x, ctx))
      return result;
  }
  return nullptr;
}

} // namespace alm::typed
