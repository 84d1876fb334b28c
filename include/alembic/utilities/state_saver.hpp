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

#include <tuple>


namespace alm::utl {

/**
 * Restore the referenced variables to their current values on scope exit
 *
 * Used by the tree builder to scope per-function state (current class,
 * enum-switch subject, id-to-name bindings) while lowering nested forms.
 */
template <typename ...T>
struct state_saver {
  state_saver(T &...refs): m_save {refs...}, m_refs {refs...} { }

  ~state_saver()
  { m_refs = m_save; }

  state_saver(const state_saver&) = delete;
  state_saver& operator = (const state_saver&) = delete;

  private:
  std::tuple<T...> m_save;
  std::tuple<T&...> m_refs;
}; // struct alm::utl::state_saver

} // namespace alm::utl
