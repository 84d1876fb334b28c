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


#include "alembic/sexpr_parser.hpp"
#include "alembic/format.hpp" // IWYU pragma: keep

#include <cctype>
#include <cstdlib>
#include <format>
#include <sstream>


static bool
_is_delimiter(int c)
{ return std::isspace(c) or c == '(' or c == ')' or c == ';' or c == '"'; }

static bool
_is_number(const std::string &s)
{
  // Operators ("-", "+=") and words strtold would accept ("inf", "nan") are
  // symbols
  size_t i = 0;
  if (i < s.size() and (s[i] == '-' or s[i] == '+'))
    i++;
  if (i < s.size() and s[i] == '.')
    i++;
  if (i >= s.size() or not std::isdigit(static_cast<unsigned char>(s[i])))
    return false;
  char *end;
  std::strtold(s.c_str(), &end);
  return *end == '\0';
}


alm::value
alm::sexpr_parser::parse(const std::string &input, const std::string &source_name)
{
  std::istringstream iss {input};
  const token_list tokens = tokenize(iss, source_name);
  if (tokens.empty())
    return nil;
  size_t pos = 0;
  return parse_tokens(tokens, pos);
}


alm::value
alm::sexpr_parser::parse_all(const std::string &input,
                             const std::string &source_name)
{
  std::istringstream iss {input};
  return parse_all(iss, source_name);
}


alm::value
alm::sexpr_parser::parse_all(std::istream &input, const std::string &source_name)
{
  const token_list tokens = tokenize(input, source_name);
  size_t pos = 0;

  stl::vector<value> result;
  while (pos < tokens.size())
    result.push_back(parse_tokens(tokens, pos));
  return list(result);
}


alm::sexpr_parser::token_list
alm::sexpr_parser::tokenize(std::istream &input, const std::string &source_name)
{
  token_list tokens;
  size_t offset = 0;

  const auto location = [&](size_t start) {
    return source_location {stl::string {source_name}, start, offset};
  };

  char c;
  while (input.get(c))
  {
    const size_t start = offset++;

    if (std::isspace(c))
      continue;

    // Comments run to the end of the line
    if (c == ';')
    {
      while (input.get(c) and c != '\n')
        offset++;
      if (c == '\n')
        offset++;
      continue;
    }

    if (c == '(')
    {
      tokens.push_back({token::type::LPAREN, "(", location(start)});
      continue;
    }
    if (c == ')')
    {
      tokens.push_back({token::type::RPAREN, ")", location(start)});
      continue;
    }

    if (c == '"')
    {
      std::string text;
      bool escaped = false, terminated = false;
      while (input.get(c))
      {
        offset++;
        if (escaped)
        {
          switch (c)
          {
            case 'n': text += '\n'; break;
            case 't': text += '\t'; break;
            case 'r': text += '\r'; break;
            default: text += c; break;
          }
          escaped = false;
        }
        else if (c == '\\')
          escaped = true;
        else if (c == '"')
        {
          terminated = true;
          break;
        }
        else
          text += c;
      }
      if (not terminated)
        throw parse_error {"Unterminated string literal", location(start)};
      tokens.push_back({token::type::STRING, text, location(start)});
      continue;
    }

    // Symbols, numbers, booleans and the lone dot
    std::string atom {c};
    while (input.peek() != std::char_traits<char>::eof() and
           not _is_delimiter(input.peek()))
    {
      atom += static_cast<char>(input.get());
      offset++;
    }

    enum token::type type;
    if (atom == ".")
      type = token::type::DOT;
    else if (atom == "#t" or atom == "#f")
      type = token::type::BOOLEAN;
    else if (_is_number(atom))
      type = token::type::NUMBER;
    else
      type = token::type::SYMBOL;
    tokens.push_back({type, atom, location(start)});
  }

  return tokens;
}


alm::value
alm::sexpr_parser::parse_tokens(const token_list &tokens, size_t &pos)
{
  // Work on a copy of `pos` to leave it intact upon exception
  size_t proxypos = pos;
  const value result = _parse_expr(tokens, proxypos);
  pos = proxypos;
  return result;
}


alm::value
alm::sexpr_parser::_parse_expr(const token_list &tokens, size_t &pos)
{
  if (pos >= tokens.size())
    throw parse_error {"Unexpected end of input"};

  const token &tok = tokens[pos++];
  switch (tok.type)
  {
    case token::type::LPAREN: {
      const value result = _parse_list_tail(tokens, pos);
      set_location(result, source_location {tok.location.source,
                                            tok.location.start,
                                            tokens[pos - 1].location.end});
      return result;
    }

    case token::type::RPAREN:
      throw parse_error {"Unexpected closing parenthesis", tok.location};

    case token::type::DOT:
      throw parse_error {"Unexpected dot", tok.location};

    default:
      return _parse_atom(tok);
  }
}


alm::value
alm::sexpr_parser::_parse_list_tail(const token_list &tokens, size_t &pos)
{
  stl::vector<value> elements;
  value tail = nil;

  while (true)
  {
    if (pos >= tokens.size())
      throw parse_error {"Unexpected end of input while parsing list"};

    const token &tok = tokens[pos];
    if (tok.type == token::type::RPAREN)
    {
      pos++;
      break;
    }

    if (tok.type == token::type::DOT)
    {
      if (elements.empty())
        throw parse_error {"Dot at the beginning of a list", tok.location};
      pos++;
      tail = _parse_expr(tokens, pos);
      if (pos >= tokens.size() or tokens[pos].type != token::type::RPAREN)
        throw parse_error {"Expected closing parenthesis after dotted pair",
                           tok.location};
      pos++;
      break;
    }

    elements.push_back(_parse_expr(tokens, pos));
  }

  value result = tail;
  for (auto it = elements.rbegin(); it != elements.rend(); ++it)
    result = cons(*it, result);
  return result;
}


alm::value
alm::sexpr_parser::_parse_atom(const token &tok)
{
  value result = nil;
  switch (tok.type)
  {
    case token::type::SYMBOL:
      result = sym(tok.text);
      break;

    case token::type::STRING:
      result = str(tok.text);
      break;

    case token::type::NUMBER:
      result = num(std::strtold(tok.text.c_str(), nullptr));
      break;

    case token::type::BOOLEAN:
      return tok.text == "#t" ? True : False;

    default:
      throw parse_error {
          std::format("Unexpected token: {}", tok.text), tok.location};
  }

  set_location(result, tok.location);
  return result;
}


alm::value
alm::operator ""_sexpr (const char *text, size_t length)
{
  sexpr_parser parser;
  return parser.parse(std::string {text, length});
}
