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

#include "alembic/memory.hpp"
#include "alembic/stl.hpp"

#include <optional>
#include <utility>
#include <variant>

/**
 * \file pattern.hpp
 * Destructuring patterns
 *
 * Patterns only appear in binding positions: clause heads, left-hand sides
 * of a match and function parameters.
 *
 * \ingroup ast
 */


namespace alm::ast {

struct node;
using node_ptr = const node*;

struct pattern;
using pattern_ptr = const pattern*;
using pattern_list = stl::vector<pattern_ptr>;


struct var_pattern {
  stl::string name;
  std::optional<long> source_id;
};

/** Literal leaf (number, string, atom, boolean or nil node) */
struct literal_pattern {
  node_ptr value = nullptr;
};

struct tuple_pattern {
  pattern_list elements;
};

struct list_pattern {
  pattern_list elements;
};

/** `[h1, h2 | t]` */
struct cons_pattern {
  pattern_list heads;
  pattern_ptr tail = nullptr;
};

struct map_pattern {
  stl::vector<std::pair<node_ptr, pattern_ptr>> entries;
};

struct struct_pattern {
  stl::string module;
  stl::vector<std::pair<stl::string, pattern_ptr>> fields;
};

/** `^name` */
struct pin_pattern {
  stl::string name;
};

struct wildcard_pattern { };

struct bitstring_pattern {
  struct segment {
    pattern_ptr value = nullptr;
    stl::string spec; /**< Size and type modifiers, e.g. `size(8)-binary` */
  };
  stl::vector<segment> segments;
};


using pattern_variant = std::variant<
  var_pattern,
  literal_pattern,
  tuple_pattern,
  list_pattern,
  cons_pattern,
  map_pattern,
  struct_pattern,
  pin_pattern,
  wildcard_pattern,
  bitstring_pattern
>;

struct pattern {
  pattern_variant data;

  template <typename T>
  const T*
  get() const noexcept
  { return std::get_if<T>(&data); }

  template <typename T>
  bool
  is() const noexcept
  { return std::holds_alternative<T>(data); }
}; // struct alm::ast::pattern


template <typename T>
pattern_ptr
make_pattern(T &&alt)
{ return make<pattern>(pattern_variant {std::forward<T>(alt)}); }

} // namespace alm::ast
