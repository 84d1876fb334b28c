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
#include "alembic/source_location.hpp"

#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>


namespace alm {

/**
 * Malformed input tree
 *
 * \ingroup core
 */
struct bad_code: std::runtime_error {
  bad_code(std::string_view what): runtime_error(std::string(what)) { }
  bad_code(std::string_view what, const source_location &location);
  bad_code(std::string_view what, value code);

  void
  display(std::ostream &os) const noexcept;

  std::string
  display() const
  {
    std::ostringstream buf;
    display(buf);
    return buf.str();
  }

  private:
  std::optional<source_location> m_location;
}; // struct alm::bad_code


/**
 * No rule of a syntax table matched a form
 *
 * \ingroup core
 */
struct code_transformation_error: bad_code {
  code_transformation_error(std::string_view what, value code)
  : bad_code(what, code), m_code {code}
  { }

  value
  code() const noexcept
  { return m_code; }

  private:
  value m_code;
}; // struct alm::code_transformation_error


/**
 * Internal consistency fault
 *
 * Raised when a pattern extractor rejects a subtree its own predicate has
 * accepted, or when a component meets a node shape it has no rendering for.
 * This is never an input error and is never recovered from inside the
 * library.
 *
 * \ingroup core
 */
struct internal_defect: std::logic_error {
  internal_defect(std::string_view component, std::string_view what,
                  std::string_view subtree);

  /** Pass, pattern or component that detected the fault */
  const std::string&
  component() const noexcept
  { return m_component; }

  /** Textual dump of the offending subtree */
  const std::string&
  subtree() const noexcept
  { return m_subtree; }

  private:
  std::string m_component;
  std::string m_subtree;
}; // struct alm::internal_defect

} // namespace alm
