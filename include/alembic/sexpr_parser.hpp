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
#include "alembic/exceptions.hpp"
#include "alembic/stl.hpp"

#include <istream>
#include <string>

/**
 * \file sexpr_parser.hpp
 * Reader for the typed-tree interchange format
 *
 * \ingroup sexpr
 */


namespace alm {

/**
 * S-expression reader
 *
 * Accepts symbols, strings, numbers, `#t`/`#f`, `()`, dotted pairs and `;`
 * comments. Every parsed cell except the shared singletons gets a
 * source_location.
 *
 * \ingroup sexpr
 */
class sexpr_parser {
  public:
  struct token {
    enum class type {
      LPAREN,
      RPAREN,
      DOT,
      SYMBOL,
      STRING,
      NUMBER,
      BOOLEAN,
    };
    type type;
    std::string text;
    source_location location;
  };

  using token_list = stl::vector<token>;

  /** Read the first expression of \p input */
  value
  parse(const std::string &input, const std::string &source_name = "<string>");

  /** Read all expressions of \p input into a list */
  value
  parse_all(const std::string &input, const std::string &source_name = "<string>");

  value
  parse_all(std::istream &input, const std::string &source_name = "<stream>");

  token_list
  tokenize(std::istream &input, const std::string &source_name = "<stream>");

  /**
   * Parse one expression starting at \p pos
   *
   * On success \p pos points past the expression; on failure it is left
   * untouched.
   *
   * \throws parse_error
   */
  value
  parse_tokens(const token_list &tokens, size_t &pos);

  private:
  value
  _parse_expr(const token_list &tokens, size_t &pos);

  value
  _parse_list_tail(const token_list &tokens, size_t &pos);

  value
  _parse_atom(const token &tok);
}; // class alm::sexpr_parser


/**
 * Reader error
 *
 * \ingroup sexpr
 */
struct parse_error: public bad_code {
  using bad_code::bad_code;
}; // struct alm::parse_error


/**
 * Parse the first expression of a string literal
 *
 * \ingroup sexpr
 */
value
operator ""_sexpr (const char *text, size_t length);

} // namespace alm
