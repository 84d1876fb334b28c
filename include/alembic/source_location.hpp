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

#include <string>
#include <string_view>

/**
 * \file source_location.hpp
 * Positions of typed-tree forms in their input file
 *
 * \ingroup sexpr
 */


namespace alm {

/**
 * Byte range inside a named input
 *
 * Sources whose name starts with '<' (e.g. "<string>") are not files and are
 * reported by offsets only.
 *
 * \ingroup sexpr
 */
struct source_location {
  stl::string source;
  size_t start = 0;
  size_t end = 0;

  bool
  operator == (const source_location &other) const noexcept
  { return source == other.source and start == other.start and end == other.end; }
}; // struct alm::source_location

/**
 * Attach \p loc to \p x
 *
 * Singletons (nil and booleans) are shared and never carry a location.
 */
void
set_location(value x, const source_location &loc);

/**
 * \param[out] location Location of \p x if available
 * \return True if \p x carries a location
 */
[[nodiscard]] bool
get_location(value x, source_location &location);

/**
 * Render the first line of \p location with the located range highlighted
 */
[[nodiscard]] std::string
display_location(const source_location &location,
                 std::string_view hlstyle = "\e[38;5;1;1m");

} // namespace alm
