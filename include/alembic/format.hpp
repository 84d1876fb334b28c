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

#include <algorithm>
#include <format>
#include <sstream>

/**
 * \file format.hpp
 * std::format support for S-expressions
 *
 * `{}` writes the value in reader syntax, `{:d}` displays strings unquoted.
 *
 * \ingroup utils
 */


template <>
struct std::formatter<alm::value, char> {
  bool display = false;

  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it == 'd')
    {
      display = true;
      ++it;
    }
    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for alm::value"};
    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(alm::value x, FmtContext &ctx) const
  {
    std::ostringstream buffer;
    if (display)
      alm::display(buffer, x);
    else
      alm::write(buffer, x);
    return std::ranges::copy(std::move(buffer).str(), ctx.out()).out;
  }
}; // struct std::formatter<alm::value>
