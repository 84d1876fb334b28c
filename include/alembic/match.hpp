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
#include "alembic/format.hpp" // IWYU pragma: export

#include <concepts>

/**
 * \file match.hpp
 * Structural matching of S-expressions against templates
 *
 * A template is an S-expression where symbols listed as literals must match
 * themselves, `_` matches anything, any other symbol binds the matched
 * subexpression, and `x ...` matches any number of consecutive elements
 * (collecting the bindings of `x` into lists).
 *
 * \ingroup sexpr
 */


namespace alm {

template <typename T>
concept value_mapping = requires(T &x, value k)
{
  { x.contains(k) } -> std::convertible_to<bool>;
  { x.at(k) } -> std::convertible_to<value>;
  { x.insert(std::make_pair(k, k)) };
  { x.insert_or_assign(k, k) };
};

using match_mapping = stl::unordered_map<value, value>;


class match {
  public:
  match(value literals, value pattern)
  : m_literals {literals}, m_pattern {pattern}
  { }

  value
  pattern() const noexcept
  { return m_pattern; }

  template <value_mapping Mapping>
  bool
  operator () (value expr, Mapping &result) const
  { return _match(m_pattern, expr, result); }

  bool
  operator () (value expr) const
  {
    match_mapping _;
    return _match(m_pattern, expr, _);
  }

  private:
  template <value_mapping Mapping>
  bool
  _match(value pat, value expr, Mapping &result) const;

  template <value_mapping Mapping>
  void
  _collect_variables(value pat, Mapping &result) const;

  private:
  value m_literals;
  value m_pattern;
}; // class alm::match

} // namespace alm

#include "alembic/match.inl"
