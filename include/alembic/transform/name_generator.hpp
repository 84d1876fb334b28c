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

#include <format>
#include <string>
#include <string_view>


namespace alm {

/**
 * Source of fresh identifiers
 *
 * Wraps a counter owned by the compilation unit, so every generator created
 * for one unit mints names from the same sequence while different units stay
 * independent.
 *
 * ```
 * size_t counter = 0;
 * name_generator gensym {counter};
 * gensym();            // => "while_loop_1"
 * gensym("temp_{}");   // => "temp_2"
 * ```
 */
class name_generator {
  public:
  explicit name_generator(size_t &counter,
                          std::string_view format = "while_loop_{}")
  : m_format {format}, m_counter {counter}
  { }

  std::string
  operator () ()
  {
    m_counter ++;
    return std::vformat(m_format, std::make_format_args(m_counter));
  }

  std::string
  operator () (std::string_view format)
  {
    m_counter ++;
    return std::vformat(format, std::make_format_args(m_counter));
  }

  size_t
  counter() const noexcept
  { return m_counter; }

  private:
  const std::string m_format;
  size_t &m_counter;
}; // class alm::name_generator

} // namespace alm
