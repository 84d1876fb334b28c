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

#include "alembic/value.hpp"
#include "alembic/stl.hpp"

#include <string_view>

/**
 * \file forms.hpp
 * Accessors for typed-tree forms
 *
 * Every typed expression reads `(<form> <type> <operand>...)`. Types are
 * symbols (`Int`, `String`, ...) or lists headed by a type constructor
 * (`(Array Int)`, `(Class Point)`).
 *
 * \ingroup typed
 */


namespace alm::typed {

/** Head symbol of a typed form, or an empty view */
[[nodiscard]] inline std::string_view
form_name(value x) noexcept
{
  if (ispair(x) and issym(car<false>(x)))
    return sym_name(car<false>(x));
  return { };
}

[[nodiscard]] inline bool
is_form(value x, std::string_view name) noexcept
{ return form_name(x) == name; }

/**
 * \throws std::runtime_error If \p x is not a typed form
 */
[[nodiscard]] inline value
type_of(value x)
{ return car(cdr(x)); }

/** Everything after the type */
[[nodiscard]] inline value
operands(value x)
{ return cdr(cdr(x)); }

[[nodiscard]] inline value
operand(value x, size_t k)
{ return list_ref(operands(x), k); }

/** Elements of a list */
[[nodiscard]] inline stl::vector<value>
elements(value l)
{
  stl::vector<value> result;
  for (const value x : range(l))
    result.push_back(x);
  return result;
}

/** `Array` for `(Array Int)`, `Int` for `Int` */
[[nodiscard]] inline std::string_view
type_name(value t) noexcept
{
  if (issym(t))
    return sym_name(t);
  if (ispair(t) and issym(car<false>(t)))
    return sym_name(car<false>(t));
  return { };
}

/** Parameter \p k of a type constructor, e.g. `Point` of `(Class Point)` */
[[nodiscard]] inline value
type_argument(value t, size_t k)
{ return list_ref(t, k + 1); }

} // namespace alm::typed
