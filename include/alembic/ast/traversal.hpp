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

#include "alembic/ast/node.hpp"

#include <concepts>
#include <functional>

/**
 * \file traversal.hpp
 * Generic traversal and rewrite combinators
 *
 * for_each_child() and rebuild() are the only places that know the layout of
 * every node variant; both dispatch through std::visit over an overload set
 * without a catch-all, so a new variant does not compile until it is handled
 * in both. Everything else (visit(), rewrite(), walk() and all passes) is
 * written on top of them.
 *
 * \ingroup ast
 */


namespace alm::ast {

/**
 * Position a child occupies in its parent
 *
 * \ingroup ast
 */
enum class child_role {
  element,    /**< list, tuple or bitstring element */
  map_key,
  map_value,  /**< value slot of a map, struct or keyword list */
  argument,   /**< call argument */
  operand,    /**< operand of an operator, field access, index or range */
  paren,
  match_rhs,  /**< right-hand side of a match or an imperative assignment */
  statement,  /**< statement of a block or module body */
  body,       /**< body of a function, clause, comprehension or `try` */
  branch,     /**< branch of an `if` or `cond` */
  condition,
  subject,    /**< subject of a `case` */
  guard,
  target,     /**< callee of an application, receiver of a remote call,
                   left-hand side of an imperative assignment */
  other,
};

/** True for roles where only a single expression is syntactically legal */
constexpr bool
is_expression_role(child_role role) noexcept
{
  switch (role)
  {
    case child_role::element:
    case child_role::map_value:
    case child_role::argument:
    case child_role::operand:
    case child_role::paren:
    case child_role::match_rhs:
      return true;
    default:
      return false;
  }
}


using child_visitor = std::function<void(node_ptr, child_role)>;
using pattern_visitor = std::function<void(pattern_ptr)>;
using child_rewriter = std::function<node_ptr(node_ptr, child_role)>;
using pattern_rewriter = std::function<pattern_ptr(pattern_ptr)>;


/**
 * Call \p fn on every direct non-null child of \p x, in source order
 *
 * \param pfn Called on every direct pattern of \p x (parameters, clause
 *            heads, left-hand sides of matches)
 */
void
for_each_child(node_ptr x, const child_visitor &fn,
               const pattern_visitor &pfn = nullptr);

/**
 * Rebuild \p x from its direct children mapped through \p fn
 *
 * Metadata is copied to the rebuilt node. If no child changes, \p x itself
 * is returned.
 */
[[nodiscard]] node_ptr
rebuild(node_ptr x, const child_rewriter &fn,
        const pattern_rewriter &pfn = nullptr);


/**
 * Call \p visitor on every direct child of \p x (non-recursive)
 */
inline void
visit(node_ptr x, const std::function<void(node_ptr)> &visitor)
{ for_each_child(x, [&](node_ptr child, child_role) { visitor(child); }); }

/**
 * Bottom-up rewrite
 *
 * Children are rewritten first, \p x is rebuilt from them and \p transformer
 * is applied to the rebuilt node. Raw-code leaves are returned as they are,
 * without invoking \p transformer.
 */
[[nodiscard]] node_ptr
rewrite(node_ptr x, const std::function<node_ptr(node_ptr)> &transformer);

/**
 * Pre-order traversal
 *
 * Children of a node are visited only if \p fn returns true for it.
 */
void
walk(node_ptr x, const std::function<bool(node_ptr)> &fn);

/**
 * Replace statements by statement sequences, everywhere in \p x
 *
 * \p fn is applied to every statement of every block and to every body or
 * branch that is a single statement; a result of several statements is
 * spliced into the enclosing block (or becomes one). Nested statements are
 * expanded before the statements containing them.
 */
[[nodiscard]] node_ptr
expand_statements(node_ptr x, const std::function<node_list(node_ptr)> &fn);


/**
 * \name Patterns
 * \{
 */

void
for_each_subpattern(pattern_ptr p, const pattern_visitor &fn);

/**
 * Bottom-up rewrite of a pattern and its sub-patterns
 */
[[nodiscard]] pattern_ptr
rewrite_pattern(pattern_ptr p, const pattern_rewriter &fn);

/**
 * Names bound by \p p, in order of appearance (pins excluded)
 */
[[nodiscard]] stl::vector<stl::string>
pattern_variables(pattern_ptr p);

/** \} */


template <typename T>
concept node_transformation = requires(const T t, node_ptr x)
{
  { t(x) } -> std::convertible_to<node_ptr>;
};

} // namespace alm::ast
