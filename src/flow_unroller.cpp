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


#include "alembic/typed/flow_unroller.hpp"
#include "alembic/typed/forms.hpp"



namespace alm {

using typed::is_form;
using typed::type_of;
using typed::operands;

static bool
_always_returns(value x)
{
  if (is_form(x, "return") or is_form(x, "throw"))
    return true;
  if (is_form(x, "block"))
    return ispair(operands(x)) and _always_returns(last(operands(x)));
  if (is_form(x, "if") and length(x) == 5)
    return _always_returns(list_ref(x, 3)) and _always_returns(list_ref(x, 4));
  return false;
}

static value
_block(value type, value head, const stl::vector<value> &tail)
{
  return cons("block", cons(type, cons(head, list(tail))));
}

value
flow_unroller::operator () (value form) const
{
  if (not ispair(form))
    return form;
  // Nothing inside a loop may be moved past its iteration
  if (is_form(form, "while") or is_form(form, "for-in"))
    return form;

  value result = nil;
  value it = form;
  for (; ispair(it); it = cdr(it))
    result = cons((*this)(car(it)), result);
  result = reverse(result, it);

  return is_form(result, "block") ? _unroll_block(result) : result;
}

value
flow_unroller::_unroll_block(value block) const
{
  const value type = type_of(block);
  const stl::vector<value> stmts = typed::elements(operands(block));

  stl::vector<value> kept;
  for (size_t i = 0; i < stmts.size(); ++i)
  {
    const value stmt = stmts[i];
    const bool has_rest = i + 1 < stmts.size();
    if (not has_rest)
    {
      kept.push_back(stmt);
      break;
    }

    if (_always_returns(stmt))
    {
      kept.push_back(stmt);
      break;
    }

    if (is_form(stmt, "if"))
    {
      const stl::vector<value> rest {stmts.begin() + i + 1, stmts.end()};
      const value if_type = type_of(stmt);
      const value cond = list_ref(stmt, 2), then = list_ref(stmt, 3);
      const bool has_else = length(stmt) == 5;
      const value otherwise = has_else ? list_ref(stmt, 4) : nil;

      if (_always_returns(then))
      {
        const value tail = has_else
          ? _unroll_block(_block(type, otherwise, rest))
          : _unroll_block(cons("block", cons(type, list(rest))));
        kept.push_back(list("if", if_type, cond, then, tail));
        break;
      }
      if (has_else and _always_returns(otherwise))
      {
        const value head = _unroll_block(_block(type, then, rest));
        kept.push_back(list("if", if_type, cond, head, otherwise));
        break;
      }
    }

    kept.push_back(stmt);
  }

  return cons("block", cons(type, list(kept)));
}

} // namespace alm
