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


#include "alembic/source_location.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>


void
alm::set_location(value x, const source_location &loc)
{
  if (is(x, nil) or is(x, True) or is(x, False))
    return;
  x->location = make<source_location>(loc);
}


bool
alm::get_location(value x, source_location &location)
{
  if (x->location == nullptr)
    return false;
  location = *x->location;
  return true;
}


std::string
alm::display_location(const source_location &location, std::string_view hlstyle)
{
  if (location.source.empty() or location.source[0] == '<')
    return std::format("in {}: offset {} to {}", location.source,
                       location.start, location.end);

  std::ifstream file {location.source.c_str(), std::ios_base::binary};
  if (not file.is_open())
    return std::format("in {}: offset {} to {} (file is not readable)",
                       location.source, location.start, location.end);

  const std::string content {std::istreambuf_iterator<char>(file),
                             std::istreambuf_iterator<char>()};
  if (location.start > content.size())
    return std::format("<invalid location in {}>", location.source);

  // Line and column of the start offset
  const size_t linestart = content.rfind('\n', location.start == 0 ? 0 : location.start - 1);
  const size_t begin = (linestart == std::string::npos or location.start == 0)
                       ? 0 : linestart + 1;
  const size_t lineno = std::count(content.begin(), content.begin() + begin, '\n') + 1;
  size_t finish = content.find('\n', location.start);
  if (finish == std::string::npos)
    finish = content.size();

  const size_t hlend = std::min(location.end, finish);
  std::ostringstream output;
  output << std::format("in {}:{}:{}\n", location.source, lineno,
                        location.start - begin + 1);
  output << std::format("{:4d} | ", lineno)
         << std::string_view {content}.substr(begin, location.start - begin)
         << hlstyle
         << std::string_view {content}.substr(location.start, hlend - location.start)
         << "\e[0m"
         << std::string_view {content}.substr(hlend, finish - hlend)
         << "\n";
  return output.str();
}
