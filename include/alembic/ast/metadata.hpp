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

#include "alembic/stl.hpp"

#include <optional>
#include <utility>

/**
 * \file metadata.hpp
 * Side-channel attached to AST nodes
 *
 * \ingroup ast
 */


namespace alm::ast {

/**
 * Property bag carried by a node
 *
 * Passes use it to hand hints to later passes and to the printer without
 * changing the node shape. Rewrites copy it forward to the rebuilt node.
 *
 * \ingroup ast
 */
struct metadata {
  /** Stable binding identity of a variable read or a var pattern */
  std::optional<long> source_id;

  /** Binding identities to resolve to clause-local names inside this node */
  stl::unordered_map<long, stl::string> clause_names;

  /** Render an `if` in `, do:` form whenever its branches allow it */
  bool keep_inline = false;

  /** The module defines an exception type */
  bool is_exception = false;

  /** The block is the unrolled body of a loop */
  bool unrolled_loop = false;

  /** Number of payload fields of the matched constructor, on enum `case` */
  std::optional<int> payload_arity;

  /** Private functions (name, arity) never called inside the module */
  stl::vector<std::pair<stl::string, size_t>> unused_private_functions;
}; // struct alm::ast::metadata

} // namespace alm::ast
