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

#include "alembic/ast/node.hpp"
#include "alembic/printer/printer.hpp"
#include "alembic/transform/name_generator.hpp"
#include "alembic/transform/pipeline.hpp"
#include "alembic/typed/tree_builder.hpp"
#include "alembic/value.hpp"

#include <string>

/**
 * \file compiler.hpp
 * Compilation of a typed tree into target source
 *
 * \ingroup transform
 */


namespace alm {

/**
 * State of a single compilation unit
 *
 * Owns the fresh-name counter shared by the builder, the pipeline and the
 * printer, so generated names never collide within one output file.
 *
 * \ingroup transform
 */
class compilation_unit {
  public:
  /**
   * \throws std::invalid_argument If \p config disables an unknown pass
   */
  explicit compilation_unit(pipeline_config config = { });

  compilation_unit(const compilation_unit&) = delete;
  compilation_unit& operator = (const compilation_unit&) = delete;

  /** Lower a list of typed declarations into the intermediate AST */
  ast::node_ptr
  build(value declarations);

  /** Run the pass pipeline */
  ast::node_ptr
  transform(ast::node_ptr tree) const
  { return m_pipeline.transform(tree); }

  std::string
  print(ast::node_ptr tree)
  { return m_printer.print(tree); }

  /** build(), transform() and print() in a row */
  std::string
  compile(value declarations);

  const pipeline&
  passes() const noexcept
  { return m_pipeline; }

  private:
  size_t m_counter;
  name_generator m_gensym;
  tree_builder m_builder;
  pipeline m_pipeline;
  printer m_printer;
}; // class alm::compilation_unit


/**
 * Parse \p text as a sequence of typed declarations and compile it
 *
 * \throws parse_error
 * \throws bad_code
 * \throws code_transformation_error
 * \throws internal_defect
 */
std::string
compile_unit(const std::string &text,
             const std::string &source_name = "<string>",
             pipeline_config config = { });

} // namespace alm
