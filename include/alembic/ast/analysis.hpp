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
#include "alembic/ast/traversal.hpp"

#include <optional>
#include <string_view>

/**
 * \file analysis.hpp
 * Queries and small rewrites shared by passes and the printer
 *
 * \ingroup ast
 */


namespace alm::ast {

/** Name of a variable reference */
[[nodiscard]] std::optional<std::string_view>
var_name(node_ptr x) noexcept;

[[nodiscard]] inline bool
is_var(node_ptr x, std::string_view name) noexcept
{ return var_name(x) == name; }

/** Name bound by `name = value` */
[[nodiscard]] std::optional<std::string_view>
bound_name(node_ptr x) noexcept;

[[nodiscard]] bool
is_literal(node_ptr x) noexcept;

/**
 * Number of reads of variable \p name inside \p x
 *
 * Pinned pattern variables count as reads.
 */
[[nodiscard]] size_t
count_reads(node_ptr x, std::string_view name);

[[nodiscard]] inline bool
reads(node_ptr x, std::string_view name)
{ return count_reads(x, name) > 0; }

/** True if \p x binds \p name anywhere (match, clause head, parameter) */
[[nodiscard]] bool
binds(node_ptr x, std::string_view name);

/** True if a match or an imperative assignment occurs anywhere in \p x */
[[nodiscard]] bool
contains_assignment(node_ptr x);

/**
 * Expression without side effects
 *
 * Variables, literals, field accesses and collection literals built only
 * from pure expressions.
 */
[[nodiscard]] bool
is_pure(node_ptr x);

/** True if any bitwise operator occurs in \p x */
[[nodiscard]] bool
uses_bitwise(node_ptr x);


/** Statements of a block, or \p x alone */
[[nodiscard]] node_list
statements_of(node_ptr x);

/**
 * Block of \p statements, or the single statement itself
 *
 * Metadata of \p origin, if given, is carried to a newly created block.
 */
[[nodiscard]] node_ptr
make_sequence(node_list statements, node_ptr origin = nullptr);


/**
 * Replace every read of variable \p name by \p replacement
 */
[[nodiscard]] node_ptr
substitute(node_ptr x, std::string_view name, node_ptr replacement);

/**
 * Replace only the first read of \p name (in evaluation order) by
 * \p first and every later read by \p rest
 */
[[nodiscard]] node_ptr
substitute_first(node_ptr x, std::string_view name, node_ptr first,
                 node_ptr rest);

/**
 * Rename variable \p from to \p to at every occurrence: reads, binding
 * patterns and pins
 */
[[nodiscard]] node_ptr
rename(node_ptr x, std::string_view from, std::string_view to);

[[nodiscard]] pattern_ptr
rename(pattern_ptr p, std::string_view from, std::string_view to);

/**
 * Apply \p fn to every function definition in \p root
 *
 * A tree without definitions (a bare script or expression) is handed to
 * \p fn as a whole.
 */
[[nodiscard]] node_ptr
map_definitions(node_ptr root, const std::function<node_ptr(node_ptr)> &fn);

} // namespace alm::ast
