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


#include "alembic/exceptions.hpp"
#include "alembic/source_location.hpp"

#include <format>


alm::bad_code::bad_code(std::string_view what, value code)
: runtime_error(std::string(what))
{
  source_location location;
  if (get_location(code, location))
    m_location = location;
}


alm::bad_code::bad_code(std::string_view what, const source_location &location)
: runtime_error(std::string(what)), m_location {location}
{ }


void
alm::bad_code::display(std::ostream &os) const noexcept
{
  os << what();
  if (m_location)
    os << "\n" << display_location(m_location.value());
}


alm::internal_defect::internal_defect(std::string_view component,
                                      std::string_view what,
                                      std::string_view subtree)
: logic_error(std::format("internal defect in {}: {}", component, what)),
  m_component {component},
  m_subtree {subtree}
{ }
