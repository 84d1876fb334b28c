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

#include <iterator>


namespace alm {

/**
 * Forward iterator over the elements of a cons-list
 *
 * \ingroup core
 */
struct list_iterator {
  using difference_type = ptrdiff_t;
  using value_type = value;

  list_iterator(): m_l {nil} { }

  explicit
  list_iterator(value l): m_l {l} { }

  value
  operator * () const noexcept
  { return car<false>(m_l); }

  list_iterator&
  operator ++ () noexcept
  { m_l = cdr<false>(m_l); return *this; }

  list_iterator
  operator ++ (int) noexcept
  {
    list_iterator ret {m_l};
    m_l = cdr<false>(m_l);
    return ret;
  }

  bool
  operator == (const list_iterator &other) const noexcept
  { return is(m_l, other.m_l); }

  private:
  value m_l;

  friend struct list_sentinel;
}; // struct alm::list_iterator
static_assert(std::forward_iterator<list_iterator>);


/**
 * End of a cons-list: any non-pair cell
 *
 * \ingroup core
 */
struct list_sentinel {
  bool
  operator == (const list_iterator &it) const noexcept
  { return it.m_l->t != tag::pair; }
}; // struct alm::list_sentinel
static_assert(std::sentinel_for<list_sentinel, list_iterator>);


/**
 * View over a cons-list
 *
 * \ingroup core
 */
struct list_view: std::ranges::view_interface<list_view> {
  list_view(): m_list {nil} { }
  list_view(value l): m_list {l} { }

  list_iterator
  begin() const noexcept
  { return list_iterator {m_list}; }

  list_sentinel
  end() const noexcept
  { return { }; }

  private:
  value m_list;
}; // struct alm::list_view
static_assert(std::ranges::forward_range<list_view>);
static_assert(std::ranges::view<list_view>);

/**
 * Iterate elements of a list
 *
 * \ingroup core
 */
inline list_view
range(value l)
{ return list_view {l}; }

} // namespace alm
