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

#include <functional>
#include <string>
#include <string_view>

/**
 * \file naming.hpp
 * Mapping of source identifiers onto target naming conventions
 *
 * \ingroup builder
 */


namespace alm {

/**
 * Callback mapping a source identifier to a valid target identifier
 */
using naming_function = std::function<std::string(std::string_view)>;

/**
 * `camelCase` and `PascalCase` to `snake_case`
 *
 * Runs of capitals are kept together (`parseHTTPHeader` => `parse_http_header`)
 * and leading underscores are preserved.
 */
[[nodiscard]] std::string
snake_case(std::string_view name);

/** `snake_case` to `PascalCase` */
[[nodiscard]] std::string
pascal_case(std::string_view name);

[[nodiscard]] bool
is_reserved_word(std::string_view name);

/**
 * Name of a variable, parameter or function
 *
 * Reserved words get a `_` suffix.
 */
[[nodiscard]] std::string
identifier_name(std::string_view name);

/**
 * Module name of a dotted class path: `my_pkg.MyClass` => `MyPkg.MyClass`
 */
[[nodiscard]] std::string
module_name(std::string_view path);

} // namespace alm
