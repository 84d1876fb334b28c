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

#include "alembic/memory.hpp"

#include <cstring>
#include <ostream>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * \file value.hpp
 * S-expression cells
 *
 * The typed tree produced by the front-end arrives as S-expressions. This
 * file defines the cell representation and the list primitives the pattern
 * library and the tree builder are written in.
 *
 * \ingroup core
 */


namespace alm {

/**
 * Type tag of an S-expression cell
 *
 * \ingroup core
 */
enum class tag {
  nil,
  sym,
  str,
  num,
  pair,
  boolean,
};

struct object;
struct source_location;

/**
 * Handle to an S-expression cell
 *
 * Never null: the empty list is represented by the `nil` singleton.
 *
 * \ingroup core
 */
class value {
  public:
  explicit value(object *ptr): m_ptr {ptr} { }

  value();

  value(const char *sym);

  constexpr object*
  operator -> () const noexcept
  { return m_ptr; }

  constexpr object&
  operator * () const noexcept
  { return *m_ptr; }

  /**
   * Structural equality
   */
  [[nodiscard]] bool
  operator == (alm::value other) const noexcept;

  /**
   * Test for a symbol with name \p symbol
   */
  [[nodiscard]] bool
  operator == (const char *symbol) const noexcept;

  private:
  object *m_ptr;
}; // class alm::value


/**
 * Heap cell
 *
 * \ingroup core
 */
struct object {
  object(tag tag): t {tag} { }

  tag t;
  const source_location *location = nullptr; /**< Where the reader found it */
  union {
    struct { char *data; size_t len; } sym;
    struct { char *data; size_t len; } str;
    struct { object *car, *cdr; };
    long double num;
    bool boolean;
  };
}; // struct alm::object


extern const value True, False;
extern const value nil;


/**
 * \name Constructors
 * \{
 */

[[nodiscard]] inline value
sym(std::string_view name)
{
  value ret {make<object>(tag::sym)};
  ret->sym.data = static_cast<char*>(allocate_atomic(name.length() + 1));
  std::memcpy(ret->sym.data, name.data(), name.length());
  ret->sym.data[name.length()] = '\0';
  ret->sym.len = name.length();
  return ret;
}

[[nodiscard]] inline value
str(std::string_view text)
{
  value ret {make<object>(tag::str)};
  ret->str.data = static_cast<char*>(allocate_atomic(text.length() + 1));
  std::memcpy(ret->str.data, text.data(), text.length());
  ret->str.data[text.length()] = '\0';
  ret->str.len = text.length();
  return ret;
}

[[nodiscard]] inline value
num(long double x)
{
  value ret {make<object>(tag::num)};
  ret->num = x;
  return ret;
}

[[nodiscard]] inline value
cons(value car, value cdr)
{
  value ret {make<object>(tag::pair)};
  ret->car = &*car;
  ret->cdr = &*cdr;
  return ret;
}

[[nodiscard]] inline value
from(long double x)
{ return num(x); }

[[nodiscard]] inline value
from(double x)
{ return num(x); }

[[nodiscard]] inline value
from(int x)
{ return num(x); }

[[nodiscard]] inline value
from(const char *s)
{ return sym(s); }

[[nodiscard]] inline value
from(value x)
{ return x; }

/** \} */


/**
 * \name Type tests and accessors
 * \{
 */

[[nodiscard]] inline bool
issym(value x)
{ return x->t == tag::sym; }

[[nodiscard]] inline bool
issym(value x, std::string_view name)
{ return issym(x) and name == std::string_view {x->sym.data, x->sym.len}; }

[[nodiscard]] inline bool
isstr(value x)
{ return x->t == tag::str; }

[[nodiscard]] inline bool
isnum(value x)
{ return x->t == tag::num; }

[[nodiscard]] inline bool
ispair(value x)
{ return x->t == tag::pair; }

[[nodiscard]] inline bool
isbool(value x)
{ return x->t == tag::boolean; }

[[nodiscard]] inline bool
isnil(value x)
{ return x->t == tag::nil; }

/**
 * Name of a symbol
 *
 * \throws std::invalid_argument If \p x is not a symbol
 */
[[nodiscard]] inline std::string_view
sym_name(value x)
{
  if (not issym(x))
    throw std::invalid_argument {"sym_name() - not a symbol"};
  return std::string_view {x->sym.data, x->sym.len};
}

/**
 * Contents of a string
 *
 * \throws std::invalid_argument If \p x is not a string
 */
[[nodiscard]] inline std::string_view
str_view(value x)
{
  if (not isstr(x))
    throw std::invalid_argument {"str_view() - not a string"};
  return std::string_view {x->str.data, x->str.len};
}

/**
 * \throws std::invalid_argument If \p x is not a number
 */
[[nodiscard]] inline long double
num_val(value x)
{
  if (not isnum(x))
    throw std::invalid_argument {"num_val() - not a number"};
  return x->num;
}

/** \} */


/**
 * Object identity
 */
[[nodiscard]] inline bool
is(value a, value b)
{ return &*a == &*b; }

/**
 * Structural equality
 */
[[nodiscard]] bool
equal(value a, value b);

/**
 * Structural hash consistent with equal()
 */
[[nodiscard]] size_t
hash(value x);


/**
 * \name Lists
 * \{
 */

template <bool Test=true>
[[nodiscard]] inline value
car(value x)
{
  if constexpr (Test)
  {
    if (x->t != tag::pair)
      throw std::runtime_error {"car() - not a pair"};
  }
  return value {x->car};
}

template <bool Test=true>
[[nodiscard]] inline value
cdr(value x)
{
  if constexpr (Test)
  {
    if (x->t != tag::pair)
      throw std::runtime_error {"cdr() - not a pair"};
  }
  return value {x->cdr};
}

struct dot_t { };
constexpr dot_t dot;

template <typename Head>
[[nodiscard]] value
list(Head head)
{ return cons(from(head), nil); }

template <typename Car, typename Cdr>
[[nodiscard]] value
list(Car car, [[maybe_unused]] dot_t _, Cdr cdr)
{ return cons(from(car), from(cdr)); }

template <typename Head, typename ...Tail>
[[nodiscard]] value
list(Head head, Tail&& ...tail)
{ return cons(from(head), list(std::forward<Tail>(tail)...)); }

[[nodiscard]] inline value
reverse(value l, value tail = nil)
{
  value acc = tail;
  for (; l->t == tag::pair; l = cdr<false>(l))
    acc = cons(car<false>(l), acc);
  return acc;
}

/**
 * Build a list from any range of values
 */
template <std::ranges::range Range>
[[nodiscard]] value
list(Range range)
{
  value acc = nil;
  for (const value x : range)
    acc = cons(x, acc);
  return reverse(acc);
}

[[nodiscard]] inline size_t
length(value l)
{
  size_t len = 0;
  for (; l->t == tag::pair; l = cdr<false>(l), ++len);
  return len;
}

[[nodiscard]] inline bool
member(value x, value l)
{
  for (; l->t == tag::pair; l = cdr<false>(l))
  {
    if (equal(x, car<false>(l)))
      return true;
  }
  return false;
}

[[nodiscard]] inline value
append(value l, value x)
{
  if (l->t == tag::pair)
    return cons(car(l), append(cdr(l), x));
  else
    return x;
}

/**
 * Element \p k of a list
 *
 * \throws std::runtime_error If the list is shorter than k+1
 */
[[nodiscard]] inline value
list_ref(value l, size_t k)
{
  while (k--)
    l = cdr(l);
  return car(l);
}

/**
 * Last element of a non-empty list
 */
[[nodiscard]] inline value
last(value l)
{
  value x = car(l);
  for (l = cdr(l); ispair(l); l = cdr<false>(l))
    x = car<false>(l);
  return x;
}

/** \} */


/**
 * Write \p x in a form the reader accepts back
 */
void
write(std::ostream &os, value x);

/**
 * Like write() but strings are printed without quotes
 */
void
display(std::ostream &os, value x);

} // namespace alm


#include "alembic/list_view.inl" // IWYU pragma: export


inline std::ostream&
operator << (std::ostream &os, const alm::value &x)
{ alm::write(os, x); return os; }

inline
alm::value::value()
: m_ptr {&*alm::nil}
{ }

inline
alm::value::value(const char *sym)
: m_ptr {&*alm::sym(sym)}
{ }

inline bool
alm::value::operator == (alm::value other) const noexcept
{ return alm::equal(*this, other); }

inline bool
alm::value::operator == (const char *symbol) const noexcept
{ return issym(*this, symbol); }


template <>
struct std::hash<alm::value> {
  size_t
  operator () (const alm::value &x) const noexcept
  { return alm::hash(x); }
}; // struct std::hash<alm::value>
