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


#include "alembic/naming.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ranges>


namespace alm {

static constexpr std::array<std::string_view, 33> g_reserved_words {
  "after", "alias", "and", "case", "catch", "cond", "def", "defmacro",
  "defmodule", "defp", "defstruct", "do", "else", "end", "false", "fn", "for",
  "if", "import", "in", "nil", "not", "or", "quote", "raise", "receive",
  "require", "rescue", "true", "try", "unless", "when", "with",
};


static bool
_is_upper(char c)
{ return std::isupper(static_cast<unsigned char>(c)); }

static bool
_is_lower_or_digit(char c)
{
  return std::islower(static_cast<unsigned char>(c)) or
         std::isdigit(static_cast<unsigned char>(c));
}


std::string
snake_case(std::string_view name)
{
  std::string result;
  size_t i = 0;
  for (; i < name.size() and name[i] == '_'; ++i)
    result.push_back('_');

  for (const size_t start = i; i < name.size(); ++i)
  {
    const char c = name[i];
    if (_is_upper(c))
    {
      const bool after_lower = i > start and _is_lower_or_digit(name[i - 1]);
      const bool ends_acronym = i > start and _is_upper(name[i - 1]) and
                                i + 1 < name.size() and
                                std::islower(static_cast<unsigned char>(name[i + 1]));
      if ((after_lower or ends_acronym) and result.back() != '_')
        result.push_back('_');
      result.push_back(std::tolower(static_cast<unsigned char>(c)));
    }
    else
      result.push_back(c);
  }
  return result;
}


std::string
pascal_case(std::string_view name)
{
  std::string result;
  bool capitalize = true;
  for (const char c : name)
  {
    if (c == '_')
    {
      capitalize = true;
      continue;
    }
    result.push_back(capitalize ? std::toupper(static_cast<unsigned char>(c)) : c);
    capitalize = false;
  }
  return result;
}


bool
is_reserved_word(std::string_view name)
{ return std::ranges::find(g_reserved_words, name) != g_reserved_words.end(); }


std::string
identifier_name(std::string_view name)
{
  std::string result = snake_case(name);
  if (is_reserved_word(result))
    result.push_back('_');
  return result;
}


std::string
module_name(std::string_view path)
{
  std::string result;
  for (const auto segment : path | std::views::split('.'))
  {
    const std::string_view part {segment.begin(), segment.end()};
    if (not result.empty())
      result.push_back('.');
    if (not part.empty() and _is_upper(part.front()))
      result.append(part);
    else
      result.append(pascal_case(part));
  }
  return result;
}

} // namespace alm
