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


#include "alembic/value.hpp"

#include <cmath>
#include <exception>
#include <functional>


////////////////////////////////////////////////////////////////////////////////
//
//                             Singletons
//
static alm::object*
_initialize_boolean(alm::object *ptr, bool val)
{
  ptr->boolean = val;
  return ptr;
}

static
alm::object True_object {alm::tag::boolean}, False_object {alm::tag::boolean};
const alm::value alm::True {_initialize_boolean(&True_object, true)},
                 alm::False {_initialize_boolean(&False_object, false)};

static
alm::object nil_object {alm::tag::nil};
const alm::value alm::nil {&nil_object};


////////////////////////////////////////////////////////////////////////////////
//
//                        Equality and hashing
//
bool
alm::equal(value a, value b)
{
  // Lists are compared iteratively along the spine to keep recursion depth
  // proportional to nesting rather than to length
  while (true)
  {
    if (is(a, b))
      return true;
    if (a->t != b->t)
      return false;

    switch (a->t)
    {
      case tag::nil: return true;
      case tag::sym: return sym_name(a) == sym_name(b);
      case tag::str: return str_view(a) == str_view(b);
      case tag::num: return num_val(a) == num_val(b);
      case tag::boolean: return a->boolean == b->boolean;
      case tag::pair:
        if (not equal(car(a), car(b)))
          return false;
        a = cdr(a);
        b = cdr(b);
        continue;
    }
    std::terminate();
  }
}


size_t
alm::hash(value x)
{
  switch (x->t)
  {
    case tag::nil: return 0;
    case tag::sym: return std::hash<std::string_view> {}(sym_name(x)) * 31 + 1;
    case tag::str: return std::hash<std::string_view> {}(str_view(x));
    case tag::num: return std::hash<long double> {}(num_val(x));
    case tag::boolean: return x->boolean ? 0x51 : 0x52;
    case tag::pair: {
      size_t h = 0x9e3779b9;
      for (; ispair(x); x = cdr<false>(x))
        h ^= hash(car<false>(x)) + 0x9e3779b9 + (h << 6) + (h >> 2);
      return h ^ hash(x);
    }
  }
  std::terminate();
}


////////////////////////////////////////////////////////////////////////////////
//
//                               Printing
//
static void
_write_number(std::ostream &os, long double x)
{
  if (std::floor(x) == x and std::fabs(x) < 1e18)
    os << static_cast<long long>(x);
  else
    os << static_cast<double>(x);
}

static void
_write_string(std::ostream &os, std::string_view s)
{
  os << '"';
  for (const char c : s)
  {
    switch (c)
    {
      case '"': os << "\\\""; break;
      case '\\': os << "\\\\"; break;
      case '\n': os << "\\n"; break;
      case '\t': os << "\\t"; break;
      case '\r': os << "\\r"; break;
      default: os << c;
    }
  }
  os << '"';
}

static void
_print(std::ostream &os, alm::value x, bool quote_strings)
{
  switch (x->t)
  {
    case alm::tag::nil: os << "()"; return;
    case alm::tag::sym: os << alm::sym_name(x); return;
    case alm::tag::num: _write_number(os, alm::num_val(x)); return;
    case alm::tag::boolean: os << (x->boolean ? "#t" : "#f"); return;
    case alm::tag::str:
      if (quote_strings)
        _write_string(os, alm::str_view(x));
      else
        os << alm::str_view(x);
      return;
    case alm::tag::pair: {
      os << '(';
      _print(os, car(x), quote_strings);
      for (x = cdr(x); ispair(x); x = cdr(x))
      {
        os << ' ';
        _print(os, car(x), quote_strings);
      }
      if (not isnil(x))
      {
        os << " . ";
        _print(os, x, quote_strings);
      }
      os << ')';
      return;
    }
  }
  std::terminate();
}

void
alm::write(std::ostream &os, value x)
{ _print(os, x, true); }

void
alm::display(std::ostream &os, value x)
{ _print(os, x, false); }
