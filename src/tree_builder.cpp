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


#include "alembic/typed/tree_builder.hpp"
#include "alembic/typed/forms.hpp"
#include "alembic/ast/analysis.hpp"
#include "alembic/ast/construct.hpp"
#include "alembic/printer/printer.hpp"
#include "alembic/transform/passes.hpp"
#include "alembic/utilities/state_saver.hpp"
#include "alembic/logging.hpp"

#include <cmath>


namespace alm {

using namespace alm::ast;
using typed::is_form;
using typed::type_of;
using typed::type_name;
using typed::operands;
using typed::operand;

static std::string_view
_symbol(value x)
{
  if (not issym(x))
    throw bad_code {std::format("expected an identifier, got {}", x), x};
  return sym_name(x);
}

static long
_number(value x)
{
  if (not isnum(x))
    throw bad_code {std::format("expected a number, got {}", x), x};
  return static_cast<long>(num_val(x));
}

static node_ptr
_with_flag(node_ptr x, bool metadata::*flag)
{
  metadata meta = meta_of(x);
  meta.*flag = true;
  return with_meta(x, meta);
}

/** True if \p x contains a \p control form that applies to the current loop */
static bool
_has_control(value x, std::string_view control)
{
  if (not ispair(x))
    return false;
  if (is_form(x, control))
    return true;
  if (is_form(x, "while") or is_form(x, "for-in") or is_form(x, "fn"))
    return false;
  for (; ispair(x); x = cdr(x))
  {
    if (_has_control(car(x), control))
      return true;
  }
  return false;
}

/** `try do x catch :throw, :<kind> -> :ok end` */
static node_ptr
_catch_throw(node_ptr x, std::string_view kind)
{
  try_node t;
  t.body = x;
  t.catches.push_back({plit(atom("throw")), plit(atom(kind)), nullptr,
                       atom("ok")});
  return make_node(std::move(t));
}

static const std::unordered_map<std::string_view, binary_op>&
_binary_ops()
{
  static const std::unordered_map<std::string_view, binary_op> ops {
    {"+", binary_op::add}, {"-", binary_op::sub}, {"*", binary_op::mul},
    {"/", binary_op::div}, {"%", binary_op::rem},
    {"==", binary_op::eq}, {"!=", binary_op::neq},
    {"<", binary_op::lt}, {"<=", binary_op::le},
    {">", binary_op::gt}, {">=", binary_op::ge},
    {"&&", binary_op::and_}, {"||", binary_op::or_},
    {"&", binary_op::band}, {"|", binary_op::bor}, {"^", binary_op::bxor},
    {"<<", binary_op::bsl}, {">>", binary_op::bsr}, {">>>", binary_op::bsr},
  };
  return ops;
}


tree_builder::tree_builder(name_generator &gensym, naming_function name)
: m_gensym {gensym},
  m_name {std::move(name)},
  m_patterns {[this](value x) { return (*this)(x); }, m_name}
{
  // <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
  //                                 leaves
  append_rule(match {list("const"), list("const", "T", "x")},
      [this](const auto &ms) { return _constant(ms.at("T"), ms.at("x")); });

  append_rule(match {list("this"), list("this", "T")}, [](const auto &) {
    return var(passes::instance_parameter);
  });

  append_rule(match {list("local"), list("local", "T", "id", "name")},
      [this](const auto &ms) {
    return var(_identifier(ms.at("name")), _number(ms.at("id")));
  });

  append_rule(match {list("raw"), list("raw", "T", "code")},
      [](const auto &ms) {
    const value code = ms.at("code");
    if (not isstr(code))
      throw bad_code {"raw code must be a string", code};
    return raw(str_view(code));
  });

  // <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
  //                                bindings
  append_rule(match {list("var"), list("var", "T", "id", "name")},
      [this](const auto &ms) {
    return bind(_param(ms.at("id"), ms.at("name")), nil_lit());
  });

  append_rule(match {list("var"), list("var", "T", "id", "name", "init")},
      [this](const auto &ms) {
    return bind(_param(ms.at("id"), ms.at("name")), (*this)(ms.at("init")));
  });

  append_rule(match {list("fn"), list("fn", "T", "params", "body")},
      [this](const auto &ms) {
    pattern_list params;
    for (const value p : range(ms.at("params")))
    {
      if (length(p) != 3)
        throw bad_code {"malformed closure parameter", p};
      params.push_back(_param(car(p), car(cdr(p))));
    }
    return lambda(std::move(params), (*this)(ms.at("body")));
  });

  // <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
  //                                control
  append_rule(match {list("block"), list("block", "T", dot, "body")},
      [this](const auto &ms, value form) {
    if (const node_ptr idiom = typed::lower_idiom(form, m_patterns))
      return idiom;
    return block(_build_all(ms.at("body")));
  });

  append_rule(match {list("if"), list("if", "T", "c", "a")},
      [this](const auto &ms) {
    return if_((*this)(ms.at("c")), (*this)(ms.at("a")));
  });

  append_rule(match {list("if"), list("if", "T", "c", "a", "b")},
      [this](const auto &ms) {
    return if_((*this)(ms.at("c")), (*this)(ms.at("a")), (*this)(ms.at("b")));
  });

  append_rule(match {list("while"), list("while", "T", "c", "body")},
      [this](const auto &ms) { return _loop(ms.at("c"), ms.at("body")); });

  append_rule(match {list("for-in"),
                     list("for-in", "T", "id", "name", "xs", "body")},
      [this](const auto &ms) {
    for_node loop;
    loop.generators.push_back({_param(ms.at("id"), ms.at("name")),
                               (*this)(ms.at("xs"))});
    loop.body = _loop_body(ms.at("body"));
    const node_ptr result = make_node(std::move(loop));
    return _has_control(ms.at("body"), "break")
         ? _catch_throw(result, "break") : result;
  });

  append_rule(match {list("switch"), list("switch", "T", "x", dot, "cases")},
      [this](const auto &ms) { return _switch(ms.at("x"), ms.at("cases")); });

  append_rule(match {list("try"), list("try", "T", "body", dot, "catches")},
      [this](const auto &ms) { return _try(ms.at("body"), ms.at("catches")); });

  append_rule(match {list("return"), list("return", "T")}, [](const auto &) {
    return nil_lit();
  });

  append_rule(match {list("return"), list("return", "T", "x")},
      [this](const auto &ms) { return (*this)(ms.at("x")); });

  append_rule(match {list("throw"), list("throw", "T", "x")},
      [this](const auto &ms) { return call("raise", {(*this)(ms.at("x"))}); });

  append_rule(match {list("break"), list("break", "T")}, [](const auto &) {
    return call("throw", {atom("break")});
  });

  append_rule(match {list("continue"), list("continue", "T")}, [](const auto &) {
    return call("throw", {atom("continue")});
  });

  // <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
  //                              expressions
  append_rule(match {list("binop"), list("binop", "T", "op", "l", "r")},
      [this](const auto &ms) {
    return _binop(ms.at("T"), ms.at("op"), ms.at("l"), ms.at("r"));
  });

  append_rule(match {list("unop"), list("unop", "T", "op", "fix", "x")},
      [this](const auto &ms) {
    return _unop(ms.at("op"), ms.at("fix"), ms.at("x"));
  });

  append_rule(match {list("field"), list("field", "T", "x", "name")},
      [this](const auto &ms) { return _field(ms.at("x"), ms.at("name")); });

  append_rule(match {list("static"), list("static", "T", "class", "name")},
      [this](const auto &ms) {
    const std::string name = _identifier(ms.at("name"));
    if (const auto module = _module_of(ms.at("class")))
      return remote(*module, name);
    return call(name);
  });

  append_rule(match {list("call"), list("call", "T", "f", dot, "args")},
      [this](const auto &ms) { return _call(ms.at("f"), ms.at("args")); });

  append_rule(match {list("new"), list("new", "T", "class", dot, "args")},
      [this](const auto &ms) {
    const node_list args = _build_all(ms.at("args"));
    if (const auto module = _module_of(ms.at("class")))
      return remote(*module, "new", args);
    return call("new", args);
  });

  append_rule(match {list("array"), list("array", "T", dot, "xs")},
      [this](const auto &ms) { return list_of(_build_all(ms.at("xs"))); });

  append_rule(match {list("index"), list("index", "T", "xs", "i")},
      [this](const auto &ms) {
    const value xs = ms.at("xs");
    const node_list args {(*this)(xs), (*this)(ms.at("i"))};
    if (type_name(type_of(xs)) == "Map")
      return remote("Map", "get", args);
    return remote("Enum", "at", args);
  });

  append_rule(match {list("object"), list("object", "T", dot, "fields")},
      [this](const auto &ms) {
    map_node map;
    for (const value f : range(ms.at("fields")))
    {
      if (length(f) != 2)
        throw bad_code {"malformed object field", f};
      map.entries.emplace_back(atom(_identifier(car(f))), (*this)(car(cdr(f))));
    }
    return make_node(std::move(map));
  });

  append_rule(match {list("cast"), list("cast", "T", "x")},
      [this](const auto &ms) { return (*this)(ms.at("x")); });

  append_rule(match {list("paren"), list("paren", "T", "x")},
      [this](const auto &ms) { return paren((*this)(ms.at("x"))); });

  append_rule(match {list("meta"), list("meta", "T", "name", "x")},
      [this](const auto &ms) {
    const node_ptr x = (*this)(ms.at("x"));
    const std::string_view name = _symbol(ms.at("name"));
    if (name == "unrolled")
      return _with_flag(x, &metadata::unrolled_loop);
    if (name == "inline")
      return _with_flag(x, &metadata::keep_inline);
    return x;
  });

  // <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
  //                                 enums
  append_rule(match {list("enum-index"), list("enum-index", "T", "x")},
      [this](const auto &ms) {
    return call("elem", {(*this)(ms.at("x")), int_lit(0)});
  });

  append_rule(match {list("enum-param"),
                     list("enum-param", "T", "x", "ctor", "k")},
      [this](const auto &ms) {
    return call("elem", {(*this)(ms.at("x")), int_lit(_number(ms.at("k")) + 1)});
  });

  append_rule(match {list("enum-ctor"),
                     list("enum-ctor", "T", "enum", "ctor", dot, "args")},
      [this](const auto &ms) {
    const std::string module = module_name(_symbol(ms.at("enum")));
    return remote(module, _identifier(ms.at("ctor")), _build_all(ms.at("args")));
  });
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                              declarations
node_ptr
tree_builder::build_unit(value declarations)
{
  for (const value decl : range(declarations))
  {
    if (is_form(decl, "enum"))
      declare_enum(decl);
  }
  return block(_build_all_declarations(declarations));
}

node_ptr
tree_builder::build_declaration(value decl)
{
  if (is_form(decl, "class"))
    return _build_class(decl);
  if (is_form(decl, "enum"))
    return _build_enum(decl);
  return (*this)(decl);
}

void
tree_builder::declare_enum(value decl)
{
  if (length(decl) < 2)
    throw bad_code {"malformed enum declaration", decl};

  std::vector<int> arities;
  for (const value ctor : range(cdr(cdr(decl))))
  {
    if (not is_form(ctor, "ctor") or length(ctor) != 3)
      throw bad_code {"malformed enum constructor", ctor};
    arities.push_back(static_cast<int>(length(list_ref(ctor, 2))));
  }
  m_enums.insert_or_assign(std::string {_symbol(list_ref(decl, 1))},
                           std::move(arities));
}

node_ptr
tree_builder::_build_class(value decl)
{
  if (length(decl) < 3)
    throw bad_code {"malformed class declaration", decl};

  utl::state_saver<std::string> save {m_class};
  m_class = _symbol(list_ref(decl, 1));
  debug("build class {}", m_class);

  module_node module {stl::string {module_name(m_class)}, { }};
  metadata meta;

  for (const value attr : range(list_ref(decl, 2)))
  {
    if (issym(attr, "exception"))
      meta.is_exception = true;
    else if (is_form(attr, "doc") and length(attr) == 2 and
             isstr(list_ref(attr, 1)))
    {
      module.body.push_back(make_node(attribute_node {
        "moduledoc", str_lit(str_view(list_ref(attr, 1)))
      }));
    }
    else
      throw bad_code {std::format("unknown class attribute {}", attr), attr};
  }

  keyword_node fields;
  node_list methods;
  for (const value member : range(cdr(cdr(cdr(decl)))))
  {
    if (is_form(member, "field"))
    {
      const size_t n = length(member);
      if (n != 3 and n != 4)
        throw bad_code {"malformed field declaration", member};
      const node_ptr init = n == 4 ? (*this)(list_ref(member, 3)) : nil_lit();
      fields.entries.emplace_back(_identifier(list_ref(member, 1)), init);
    }
    else if (is_form(member, "method"))
      methods.push_back(_build_method(member));
    else
      throw bad_code {std::format("unknown class member {}", member), member};
  }

  if (not fields.entries.empty() or meta.is_exception)
    module.body.push_back(call("defstruct", {make_node(std::move(fields))}));
  module.body.insert(module.body.end(), methods.begin(), methods.end());

  const node_ptr result = make_node(std::move(module));
  return meta.is_exception ? with_meta(result, meta) : result;
}

node_ptr
tree_builder::_build_method(value method)
{
  // (method public|private static|instance name ((id name T)...) body)
  if (length(method) != 6)
    throw bad_code {"malformed method declaration", method};

  const std::string_view visibility = _symbol(list_ref(method, 1));
  const std::string_view kind = _symbol(list_ref(method, 2));
  const std::string_view source_name = _symbol(list_ref(method, 3));
  if (visibility != "public" and visibility != "private")
    throw bad_code {"method visibility must be public or private", method};
  if (kind != "static" and kind != "instance")
    throw bad_code {"method kind must be static or instance", method};

  pattern_list params;
  if (kind == "instance")
    params.push_back(pvar(passes::instance_parameter));
  for (const value p : range(list_ref(method, 4)))
  {
    if (length(p) != 3)
      throw bad_code {"malformed method parameter", p};
    params.push_back(_param(car(p), car(cdr(p))));
  }

  node_ptr body = (*this)(m_unroller(list_ref(method, 5)));

  if (source_name == "new")
  // Constructor: build the struct, run the body, return the struct
  {
    node_list statements {
      bind(passes::instance_parameter,
           make_node(struct_node {"__MODULE__", nullptr, { }}))
    };
    for (const node_ptr stmt : statements_of(body))
      statements.push_back(stmt);
    statements.push_back(var(passes::instance_parameter));
    body = block(std::move(statements));
  }

  const def_kind dkind = visibility == "private" ? def_kind::defp : def_kind::def;
  return make_node(def_node {
    dkind, stl::string {m_name(source_name)}, std::move(params), nullptr, body
  });
}

node_ptr
tree_builder::_build_enum(value decl)
{
  declare_enum(decl);
  const std::string_view name = _symbol(list_ref(decl, 1));
  module_node module {stl::string {module_name(name)}, { }};

  int64_t tag = 0;
  for (const value ctor : range(cdr(cdr(decl))))
  {
    pattern_list params;
    node_list elements {int_lit(tag++)};
    for (const value arg : range(list_ref(ctor, 2)))
    {
      const std::string param = _identifier(arg);
      params.push_back(pvar(param));
      elements.push_back(var(param));
    }
    module.body.push_back(make_node(def_node {
      def_kind::def, stl::string {_identifier(list_ref(ctor, 1))},
      std::move(params), nullptr, tuple_of(std::move(elements))
    }));
  }
  return make_node(std::move(module));
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                                helpers
node_list
tree_builder::_build_all(value forms) const
{
  node_list result;
  for (const value x : range(forms))
    result.push_back((*this)(x));
  return result;
}

node_list
tree_builder::_build_all_declarations(value decls)
{
  node_list result;
  for (const value decl : range(decls))
    result.push_back(build_declaration(decl));
  return result;
}

std::string
tree_builder::_identifier(value name) const
{ return m_name(_symbol(name)); }

pattern_ptr
tree_builder::_param(value id, value name) const
{
  return make_pattern(var_pattern {
    stl::string {_identifier(name)}, _number(id)
  });
}

std::optional<std::string>
tree_builder::_module_of(value class_name) const
{
  const std::string_view name = _symbol(class_name);
  if (name == m_class)
    return std::nullopt;
  return module_name(name);
}

node_ptr
tree_builder::_constant(value type, value x) const
{
  if (isnil(x))
    return nil_lit();
  if (isbool(x))
    return bool_lit(is(x, True));
  if (isstr(x))
    return str_lit(str_view(x));
  if (isnum(x))
  {
    const long double n = num_val(x);
    if (not std::isfinite(n))
      throw bad_code {std::format("constant {} has no Elixir literal", x), x};
    if (type_name(type) == "Float" or n != std::floor(n))
      return float_lit(static_cast<double>(n));
    return int_lit(static_cast<int64_t>(n));
  }
  throw bad_code {std::format("unsupported constant {}", x), x};
}

node_ptr
tree_builder::_binop(value type, value op, value lhs, value rhs)
{
  const std::string_view name = _symbol(op);
  if (name == "=")
    return _store(lhs, (*this)(rhs));
  if (name == "??")
    return _coalesce(lhs, rhs);

  const bool compound = name.size() > 1 and name.back() == '=' and
                        name != "==" and name != "!=" and
                        name != "<=" and name != ">=";
  if (compound)
  {
    const value base = sym(name.substr(0, name.size() - 1));
    return _store(lhs, _arithmetic(type, base, lhs, rhs));
  }
  return _arithmetic(type, op, lhs, rhs);
}

node_ptr
tree_builder::_arithmetic(value type, value op, value lhs, value rhs) const
{
  const std::string_view name = _symbol(op);
  const node_ptr l = (*this)(lhs), r = (*this)(rhs);

  const auto is_string = [](value t) { return type_name(t) == "String"; };
  if (name == "+" and (is_string(type) or is_string(type_of(lhs)) or
                       is_string(type_of(rhs))))
    return binary(binary_op::concat, l, r);

  const auto &ops = _binary_ops();
  const auto it = ops.find(name);
  if (it == ops.end())
    throw bad_code {std::format("unknown binary operator {}", name), op};
  return binary(it->second, l, r);
}

node_ptr
tree_builder::_store(value target, node_ptr rhs) const
{
  if (is_form(target, "local"))
    return bind(_param(operand(target, 0), operand(target, 1)), rhs);
  if (is_form(target, "field"))
    return assign(_field(operand(target, 0), operand(target, 1)), rhs);
  if (is_form(target, "index"))
  {
    const node_ptr object = (*this)(operand(target, 0));
    return assign(access(object, (*this)(operand(target, 1))), rhs);
  }
  throw bad_code {"invalid assignment target", target};
}

node_ptr
tree_builder::_coalesce(value lhs, value rhs)
{
  const node_ptr fallback = (*this)(rhs);
  const node_ptr l = (*this)(lhs);
  if (is_pure(l))
  {
    return _with_flag(if_(binary(binary_op::neq, l, nil_lit()), l, fallback),
                      &metadata::keep_inline);
  }

  const std::string tmp = m_gensym("tmp_{}");
  const node_ptr test =
    binary(binary_op::neq, paren(bind(tmp, l)), nil_lit());
  return _with_flag(if_(test, var(tmp), fallback), &metadata::keep_inline);
}

node_ptr
tree_builder::_unop(value op, value fix, value operand) const
{
  const std::string_view name = _symbol(op);
  const std::string_view position = _symbol(fix);
  if (position != "prefix" and position != "postfix")
    throw bad_code {"unary operator position must be prefix or postfix", fix};
  const bool prefix = position == "prefix";
  const node_ptr x = (*this)(operand);

  if (name == "!")
    return unary(unary_op::not_, x);
  if (name == "-")
    return unary(unary_op::negate, x);
  if (name == "~")
    return unary(unary_op::bnot, x);
  if (name == "++")
    return unary(prefix ? unary_op::pre_increment : unary_op::post_increment, x);
  if (name == "--")
    return unary(prefix ? unary_op::pre_decrement : unary_op::post_decrement, x);
  throw bad_code {std::format("unknown unary operator {}", name), op};
}

node_ptr
tree_builder::_field(value object, value name) const
{
  const node_ptr x = (*this)(object);
  if (_symbol(name) == "length")
  {
    const std::string_view type = type_name(type_of(object));
    if (type == "Array")
      return call("length", {x});
    if (type == "String")
      return remote("String", "length", {x});
  }
  return field(x, _identifier(name));
}

node_ptr
tree_builder::_call(value callee, value args) const
{
  if (is_form(callee, "field"))
    return _method_call(operand(callee, 0), operand(callee, 1), args);

  if (is_form(callee, "static"))
  {
    const std::string name = _identifier(operand(callee, 1));
    if (const auto module = _module_of(operand(callee, 0)))
      return remote(*module, name, _build_all(args));
    return call(name, _build_all(args));
  }

  return apply((*this)(callee), _build_all(args));
}

namespace {

/** `obj.method(args...)` lowered to `Module.function(obj, args...)` */
struct _library_method {
  std::string_view type, method, module, function;
};

constexpr _library_method _library_methods[] {
  {"Array", "map", "Enum", "map"},
  {"Array", "filter", "Enum", "filter"},
  {"Array", "join", "Enum", "join"},
  {"Array", "contains", "Enum", "member?"},
  {"Array", "reverse", "Enum", "reverse"},
  {"Map", "set", "Map", "put"},
  {"Map", "get", "Map", "get"},
  {"Map", "exists", "Map", "has_key?"},
  {"Map", "remove", "Map", "delete"},
  {"Map", "keys", "Map", "keys"},
  {"String", "toUpperCase", "String", "upcase"},
  {"String", "toLowerCase", "String", "downcase"},
  {"String", "charAt", "String", "at"},
  {"String", "split", "String", "split"},
};

} // anonymous namespace

node_ptr
tree_builder::_method_call(value object, value method, value args) const
{
  const std::string_view name = _symbol(method);
  node_list argv = _build_all(args);

  if (is_form(object, "this"))
  {
    argv.insert(argv.begin(), var(passes::instance_parameter));
    return call(m_name(name), std::move(argv));
  }

  const value type = type_of(object);
  const std::string_view tname = type_name(type);
  const node_ptr x = (*this)(object);

  if (tname == "Array")
  {
    if (name == "push" or name == "pop")
      return remote(x, name, std::move(argv));
    if (name == "concat" and argv.size() == 1)
      return binary(binary_op::list_concat, x, argv.front());
    if (name == "indexOf" and argv.size() == 1)
    {
      const node_ptr test =
        binary(binary_op::eq, var("item"), argv.front());
      return remote("Enum", "find_index", {x, lambda({pvar("item")}, test)});
    }
  }

  for (const _library_method &m : _library_methods)
  {
    if (m.type == tname and m.method == name)
    {
      argv.insert(argv.begin(), x);
      return remote(m.module, m.function, std::move(argv));
    }
  }

  if (tname == "Array" or tname == "Map" or tname == "String")
  {
    throw bad_code {
        std::format("unsupported {} method {}", tname, name), method};
  }

  if (tname == "Class")
  {
    argv.insert(argv.begin(), x);
    const value cls = typed::type_argument(type, 0);
    if (const auto module = _module_of(cls))
      return remote(*module, m_name(name), std::move(argv));
    return call(m_name(name), std::move(argv));
  }

  return apply(field(x, m_name(name)), std::move(argv));
}

node_ptr
tree_builder::_loop_body(value body) const
{
  const node_ptr x = (*this)(body);
  return _has_control(body, "continue") ? _catch_throw(x, "continue") : x;
}

node_ptr
tree_builder::_loop(value condition, value body) const
{
  const node_ptr loop = call(printer::while_placeholder,
                             {(*this)(condition), _loop_body(body)});
  return _has_control(body, "break") ? _catch_throw(loop, "break") : loop;
}

node_ptr
tree_builder::_switch(value subject, value cases) const
{
  // Payload arities of the constructors when switching on an enum tag
  const std::vector<int> *arities = nullptr;
  if (is_form(subject, "enum-index"))
  {
    const value tagged = operand(subject, 0);
    const value type = type_of(tagged);
    if (type_name(type) == "Enum")
    {
      const auto it = m_enums.find(std::string {
        _symbol(typed::type_argument(type, 0))
      });
      if (it != m_enums.end())
        arities = &it->second;
    }
  }

  case_node result {(*this)(subject), { }};
  for (const value c : range(cases))
  {
    if (is_form(c, "default") and length(c) == 2)
    {
      result.clauses.push_back({pwild(), nullptr, (*this)(list_ref(c, 1))});
      continue;
    }
    if (not is_form(c, "case") or (length(c) != 3 and length(c) != 4))
      throw bad_code {"malformed switch case", c};

    const node_ptr body = (*this)(list_ref(c, 2));
    metadata meta = meta_of(body);
    if (length(c) == 4)
    {
      const value aliases = list_ref(c, 3);
      if (not is_form(aliases, "alias"))
        throw bad_code {"expected (alias (id name)...)", aliases};
      for (const value a : range(cdr(aliases)))
      {
        if (length(a) != 2)
          throw bad_code {"malformed alias", a};
        meta.clause_names.insert_or_assign(_number(car(a)),
                                           stl::string {_identifier(car(cdr(a)))});
      }
    }

    for (const value v : range(list_ref(c, 1)))
    {
      const node_ptr literal = (*this)(v);
      metadata clause_meta = meta;
      if (arities and is_form(v, "const") and isnum(operand(v, 0)))
      {
        const long tag = _number(operand(v, 0));
        if (tag >= 0 and static_cast<size_t>(tag) < arities->size())
          clause_meta.payload_arity = (*arities)[tag];
      }
      result.clauses.push_back({plit(literal), nullptr,
                                with_meta(body, clause_meta)});
    }
  }
  return make_node(std::move(result));
}

node_ptr
tree_builder::_try(value body, value catches) const
{
  try_node result;
  result.body = (*this)(body);
  for (const value c : range(catches))
  {
    // (catch id name CatchType body)
    if (not is_form(c, "catch") or length(c) != 5)
      throw bad_code {"malformed catch clause", c};
    try_node::rescue_clause rescue;
    const value type = list_ref(c, 3);
    if (type_name(type) == "Class")
    {
      rescue.exceptions.push_back(stl::string {
        module_name(_symbol(typed::type_argument(type, 0)))
      });
    }
    rescue.var = _identifier(list_ref(c, 2));
    rescue.body = (*this)(list_ref(c, 4));
    result.rescues.push_back(std::move(rescue));
  }
  return make_node(std::move(result));
}

} // namespace alm
