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


/**
 * \file match.inl
 * Template implementation of alembic/match.hpp members
 */
#pragma once

#include "alembic/match.hpp"
#include "alembic/exceptions.hpp"


template <alm::value_mapping Mapping>
bool
alm::match::_match(value pat, value expr, Mapping &result) const
{
  switch (pat->t)
  {
    case tag::sym:
      if (sym_name(pat) == "_")
        return true;
      if (member(pat, m_literals))
        return equal(pat, expr);
      if (result.contains(pat))
        return equal(result.at(pat), expr);
      result.insert({pat, expr});
      return true;

    case tag::pair: {
      if (issym(car(pat), "..."))
        throw bad_code {std::format(
            "Ellipsis at the beginning of pattern-list: {}", pat), pat};

      value pit = pat, eit = expr;
      for (; pit->t == tag::pair; pit = cdr(pit))
      {
        if (ispair(cdr(pit)) and issym(car(cdr(pit)), "..."))
        // Greedily match consecutive elements against the repeated template
        {
          // Repeated variables are bound to lists even when nothing matched
          match_mapping element_vars;
          _collect_variables(car(pit), element_vars);
          for (const auto &[k, _] : element_vars)
          {
            if (not result.contains(k))
              result.insert({k, nil});
          }

          match_mapping subresult;
          for (; ispair(eit) and _match(car(pit), car(eit), subresult);
               eit = cdr(eit))
          {
            for (const auto &[k, v] : subresult)
            {
              const value vallist = result.contains(k) ? result.at(k) : nil;
              result.insert_or_assign(k, append(vallist, list(v)));
            }
            subresult.clear();
          }
          pit = cdr(pit);
        }
        else
        {
          if (not ispair(eit))
            return false;
          if (not _match(car(pit), car(eit), result))
            return false;
          eit = cdr(eit);
        }
      }

      return _match(pit, eit, result);
    }

    default:
      return equal(pat, expr);
  }
}


template <alm::value_mapping Mapping>
void
alm::match::_collect_variables(value pat, Mapping &result) const
{
  if (issym(pat))
  {
    if (sym_name(pat) != "_" and sym_name(pat) != "..." and
        not member(pat, m_literals))
      result.insert_or_assign(pat, nil);
  }
  else if (ispair(pat))
  {
    _collect_variables(car(pat), result);
    _collect_variables(cdr(pat), result);
  }
}
