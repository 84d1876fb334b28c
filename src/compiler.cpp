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


#include "alembic/compiler.hpp"
#include "alembic/sexpr_parser.hpp"
#include "alembic/logging.hpp"
#include "alembic/utilities/execution_timer.hpp"


namespace alm {

compilation_unit::compilation_unit(pipeline_config config)
: m_counter {0},
  m_gensym {m_counter},
  m_builder {m_gensym},
  m_pipeline {std::move(config), m_gensym},
  m_printer {m_gensym}
{ }


ast::node_ptr
compilation_unit::build(value declarations)
{
  execution_timer timer {"tree-builder"};
  return m_builder.build_unit(declarations);
}


std::string
compilation_unit::compile(value declarations)
{
  const ast::node_ptr tree = transform(build(declarations));
  execution_timer timer {"printer"};
  return print(tree);
}


std::string
compile_unit(const std::string &text, const std::string &source_name,
             pipeline_config config)
{
  sexpr_parser parser;
  const value declarations = parser.parse_all(text, source_name);
  debug("parsed {} declarations from {}", length(declarations), source_name);

  compilation_unit unit {std::move(config)};
  return unit.compile(declarations);
}

} // namespace alm
