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


#pragma once

#include "alembic/ast/metadata.hpp"
#include "alembic/ast/pattern.hpp"
#include "alembic/memory.hpp"
#include "alembic/stl.hpp"

#include <cstdint>
#include <string_view>
#include <utility>
#include <variant>

/**
 * \file node.hpp
 * Intermediate AST of the target language
 *
 * Nodes live on the collected heap and are immutable: passes produce new
 * nodes and share untouched subtrees with the input tree. Optional children
 * are null pointers.
 *
 * \ingroup ast
 */


namespace alm::ast {

using node_list = stl::vector<node_ptr>;


enum class binary_op {
  add, sub, mul, div,
  int_div, rem,
  eq, neq, strict_eq, strict_neq,
  lt, le, gt, ge,
  and_, or_,
  concat,        /**< `<>` */
  list_concat,   /**< `++` */
  list_subtract, /**< `--` */
  pipe,
  in,
  band, bor, bxor, bsl, bsr,
};

enum class unary_op {
  negate,
  not_,
  bnot,
  pre_increment, post_increment,
  pre_decrement, post_decrement,
};

enum class def_kind { def, defp, defmacro };

enum class directive_kind { import_, alias, require, use };


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                                   leaves
struct var_node {
  stl::string name;
};

struct literal_node {
  std::variant<int64_t, double, stl::string, bool> value;
};

struct atom_node {
  stl::string name;
};

struct nil_node { };

struct underscore_node { };

/** Module reference (`Map`, `MyApp.User`, `__MODULE__`) */
struct alias_node {
  stl::string name;
};

/** Target code injected verbatim; never rewritten */
struct raw_node {
  stl::string code;
};


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                                definitions
struct module_node {
  stl::string name;
  node_list body;
};

struct def_node {
  def_kind kind;
  stl::string name;
  pattern_list params;
  node_ptr guard = nullptr;
  node_ptr body = nullptr;
};

/** `@name value` */
struct attribute_node {
  stl::string name;
  node_ptr value = nullptr;
};

struct directive_node {
  directive_kind kind;
  stl::string module;
  node_ptr options = nullptr;
};


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                                  control
/** `pattern when guard -> body` */
struct clause {
  pattern_ptr pattern = nullptr;
  node_ptr guard = nullptr;
  node_ptr body = nullptr;
};
using clause_list = stl::vector<clause>;

struct if_node {
  node_ptr condition = nullptr;
  node_ptr then_branch = nullptr;
  node_ptr else_branch = nullptr;
};

struct case_node {
  node_ptr subject = nullptr;
  clause_list clauses;
};

struct cond_node {
  struct branch {
    node_ptr condition = nullptr;
    node_ptr body = nullptr;
  };
  stl::vector<branch> branches;
};

struct try_node {
  /** `rescue [var in] [Exc1, Exc2] -> body` */
  struct rescue_clause {
    stl::vector<stl::string> exceptions;
    stl::string var;
    node_ptr body = nullptr;
  };
  /** `catch [kind,] value [when guard] -> body` */
  struct catch_clause {
    pattern_ptr kind = nullptr;
    pattern_ptr value = nullptr;
    node_ptr guard = nullptr;
    node_ptr body = nullptr;
  };
  node_ptr body = nullptr;
  stl::vector<rescue_clause> rescues;
  stl::vector<catch_clause> catches;
  clause_list else_clauses;
  node_ptr after = nullptr;
};

struct with_node {
  struct binding {
    pattern_ptr pattern = nullptr;
    node_ptr value = nullptr;
  };
  stl::vector<binding> bindings;
  node_ptr body = nullptr;
  clause_list else_clauses;
};

struct receive_node {
  clause_list clauses;
  node_ptr timeout = nullptr;
  node_ptr after_body = nullptr;
};


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                                data literals
struct list_node {
  node_list elements;
  node_ptr tail = nullptr;
};

struct tuple_node {
  node_list elements;
};

/** `%{k => v}` or, with a base, `%{base | k => v}` */
struct map_node {
  node_ptr base = nullptr;
  stl::vector<std::pair<node_ptr, node_ptr>> entries;
};

struct keyword_node {
  stl::vector<std::pair<stl::string, node_ptr>> entries;
};

/** `%Module{f: v}` or, with a base, `%Module{base | f: v}` */
struct struct_node {
  stl::string module;
  node_ptr base = nullptr;
  stl::vector<std::pair<stl::string, node_ptr>> fields;
};

struct bitstring_node {
  struct segment {
    node_ptr value = nullptr;
    stl::string spec;
  };
  stl::vector<segment> segments;
};


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                                expressions
struct call_node {
  stl::string name;
  node_list args;
};

/** `Target.name(args)` */
struct remote_call_node {
  node_ptr target = nullptr;
  stl::string name;
  node_list args;
};

/** `fun.(args)` */
struct apply_node {
  node_ptr function = nullptr;
  node_list args;
};

struct binary_node {
  binary_op op;
  node_ptr lhs = nullptr;
  node_ptr rhs = nullptr;
};

struct unary_node {
  unary_op op;
  node_ptr operand = nullptr;
};

/** `object.field` */
struct field_node {
  node_ptr object = nullptr;
  stl::string field;
};

/** `object[key]` */
struct access_node {
  node_ptr object = nullptr;
  node_ptr key = nullptr;
};

struct range_node {
  node_ptr first = nullptr;
  node_ptr last = nullptr;
  node_ptr step = nullptr;
};

struct paren_node {
  node_ptr inner = nullptr;
};

struct block_node {
  node_list statements;
};


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                                  binding
/** `pattern = value` */
struct match_node {
  pattern_ptr pattern = nullptr;
  node_ptr value = nullptr;
};

/**
 * Imperative store into a field or index path, `a.b[k] = v`
 *
 * Produced by the tree builder; the mutability pass lowers the shapes it
 * recognizes.
 */
struct assign_node {
  node_ptr target = nullptr;
  node_ptr value = nullptr;
};

struct fn_node {
  struct fn_clause {
    pattern_list params;
    node_ptr guard = nullptr;
    node_ptr body = nullptr;
  };
  stl::vector<fn_clause> clauses;
};

/** `for pat <- source, filter, into: into do body end` */
struct for_node {
  struct generator {
    pattern_ptr pattern = nullptr;
    node_ptr source = nullptr;
  };
  stl::vector<generator> generators;
  node_list filters;
  node_ptr into = nullptr;
  node_ptr body = nullptr;
};


using node_variant = std::variant<
  // leaves
  var_node, literal_node, atom_node, nil_node, underscore_node, alias_node,
  raw_node,
  // definitions
  module_node, def_node, attribute_node, directive_node,
  // control
  if_node, case_node, cond_node, try_node, with_node, receive_node,
  // data
  list_node, tuple_node, map_node, keyword_node, struct_node, bitstring_node,
  // expressions
  call_node, remote_call_node, apply_node, binary_node, unary_node,
  field_node, access_node, range_node, paren_node, block_node,
  // binding
  match_node, assign_node, fn_node, for_node
>;


struct node {
  node_variant data;
  const metadata *meta = nullptr;

  template <typename T>
  const T*
  get() const noexcept
  { return std::get_if<T>(&data); }

  template <typename T>
  bool
  is() const noexcept
  { return std::holds_alternative<T>(data); }
}; // struct alm::ast::node


template <typename T>
node_ptr
make_node(T &&alt, const metadata *meta = nullptr)
{ return make<node>(node_variant {std::forward<T>(alt)}, meta); }

/**
 * Metadata of \p x, or an empty bag if it has none
 */
const metadata&
meta_of(node_ptr x) noexcept;

/**
 * Copy of \p x carrying \p meta instead of its current metadata
 */
node_ptr
with_meta(node_ptr x, const metadata &meta);

/**
 * \p x standing in for \p origin
 *
 * Hints set on \p origin are merged into a copy of \p x; the binding
 * identity of \p x is kept. Returns \p x itself if \p origin carries no
 * metadata.
 */
node_ptr
inherit_meta(node_ptr x, node_ptr origin);


/** Textual name of the variant held by \p x, e.g. "case" */
std::string_view
kind_name(node_ptr x) noexcept;

/**
 * Indented S-expression rendering of a subtree
 *
 * Used for `--dump-ast` and for the subtree attached to internal defects.
 */
std::string
dump(node_ptr x);

std::string
dump(pattern_ptr p);

} // namespace alm::ast
