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
#include "alembic/transform/name_generator.hpp"

#include <string_view>

/**
 * \file passes.hpp
 * Tree-rewrite passes of the default pipeline
 *
 * Every pass is a pure function from a tree to a tree: it either rewrites a
 * subtree completely or returns it unchanged. Passes are listed in pipeline
 * order; each one relies on the shapes left by the ones before it.
 *
 * \ingroup transform
 */


namespace alm::passes {

/** Name of the receiver parameter of instance methods */
constexpr std::string_view instance_parameter = "struct";


/**
 * Rename variable reads and var patterns whose binding identity appears in
 * the clause-local name map of an enclosing node
 */
[[nodiscard]] ast::node_ptr
clause_local_resolution(ast::node_ptr root);

/**
 * Collapse `tmp = A; B` into `B[tmp := (A)]` where a single expression is
 * required
 *
 * Only blocks in expression position (collection element, map value, call
 * argument, operand, parenthesized expression, right-hand side of a match)
 * are collapsed, and only if `B` reads `tmp`. If `A` is impure and `tmp` is
 * read more than once, the first read becomes `(tmp = A)`.
 */
[[nodiscard]] ast::node_ptr
temp_binding_collapse(ast::node_ptr root);

/**
 * Lower array, counter and field mutation into rebinding
 *
 * - `struct.f.push(v)` => `struct = %{struct | f: struct.f ++ [v]}`
 * - `a.push(v)` => `a = a ++ [v]`
 * - `a.pop()` => `a = List.delete_at(a, -1)`
 * - `x = a.pop()` => `x = List.last(a)`, `a = List.delete_at(a, -1)`
 * - `i++` => `i = i + 1`; `x = i++` => `x = i`, `i = i + 1`;
 *   `x = ++i` => `i = i + 1`, `x = i`
 * - imperative store into a local or into `struct.f` => match or update
 *
 * The forms above apply where the value is discarded. Where it is used, the
 * rebinding is followed by the value: the popped element or the previous
 * count (both kept in a temporary minted from \p gensym), the new count, or
 * the new length after a push. Such a sequence inside an expression is left
 * as a block for effect_lifting().
 *
 * Any other receiver is left untouched.
 */
[[nodiscard]] ast::node_ptr
mutable_lowering(ast::node_ptr root, name_generator &gensym);

/**
 * `if c do x = f(x) end` => `x = if c do f(x) else x end`
 */
[[nodiscard]] ast::node_ptr
conditional_reassignment(ast::node_ptr root);

/**
 * Drop `x = nil` when `x` is rebound later in the same block before being
 * read
 */
[[nodiscard]] ast::node_ptr
redundant_nil_init(ast::node_ptr root);

/**
 * Rebind the result of discarded functional updates:
 * `Map.put(m, k, v)` in statement position => `m = Map.put(m, k, v)`
 */
[[nodiscard]] ast::node_ptr
statement_context(ast::node_ptr root);

/** True for the functional-update calls statement_context() rebinds */
[[nodiscard]] bool
is_functional_update(std::string_view module, std::string_view function);

/**
 * Rebuild comprehensions from unrolled loops
 *
 * Only blocks flagged as unrolled loops are considered. Index variables are
 * minted from \p gensym when the enclosing function already uses `i` or `j`.
 */
[[nodiscard]] ast::node_ptr
loop_reconstruction(ast::node_ptr root, name_generator &gensym);

/**
 * `case elem(x, 0) do 1 -> v = elem(x, 1); ... end` =>
 * `case x do {1, v} -> ... end`
 */
[[nodiscard]] ast::node_ptr
enum_pattern_reconstruction(ast::node_ptr root);

/**
 * Move assignments and statement sequences out of collection literals and
 * call arguments into preceding statements
 *
 * Evaluation order is kept: when a slot is hoisted, every earlier slot with
 * effects is bound to a temporary minted from \p gensym first. The right
 * operand of `and`/`or` is never lifted.
 */
[[nodiscard]] ast::node_ptr
effect_lifting(ast::node_ptr root, name_generator &gensym);

/**
 * Prefix never-read bindings with `_` and strip the prefix of underscored
 * bindings that are read, per function
 */
[[nodiscard]] ast::node_ptr
usage_hygiene(ast::node_ptr root);

/**
 * Record private functions never called inside their module in the module
 * metadata
 */
[[nodiscard]] ast::node_ptr
unused_private_functions(ast::node_ptr root);

/**
 * Add `require Bitwise` to modules using bitwise operators
 */
[[nodiscard]] ast::node_ptr
bitwise_import(ast::node_ptr root);

} // namespace alm::passes
