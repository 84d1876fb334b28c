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
#include "alembic/transform/name_generator.hpp"

#include <string>
#include <string_view>

/**
 * \file printer.hpp
 * Unparser from the intermediate AST to target source text
 *
 * \ingroup printer
 */


namespace alm {

/**
 * True if \p name can be written as a bare atom or keyword key
 *
 * A letter or underscore, then letters, digits and underscores, optionally
 * ending in `!` or `?`.
 */
[[nodiscard]] bool
is_bare_atom(std::string_view name) noexcept;

/** `:name` or `:"na me"` */
[[nodiscard]] std::string
atom_literal(std::string_view name);

/**
 * Escape backslash, double quote, newline, carriage return and tab
 */
[[nodiscard]] std::string
escape_string(std::string_view text);

/**
 * Expression eligible for single-line rendering
 *
 * Literals, variables, field accesses, collection literals and operators
 * over simple operands, and calls with at most two simple arguments. Never
 * an assignment or a block.
 */
[[nodiscard]] bool
is_simple(ast::node_ptr x);


/**
 * Context-aware printer
 *
 * Every node variant has a rendering; a shape that cannot be rendered in its
 * position raises internal_defect. While-loop placeholders take their names
 * from the compilation unit's name generator.
 *
 * \ingroup printer
 */
class printer {
  public:
  /** Placeholder call the builder emits for `while` loops */
  static constexpr std::string_view while_placeholder = "__while__";

  explicit printer(name_generator &gensym)
  : m_gensym {gensym}
  { }

  /**
   * Render \p x at zero indentation in statement position
   *
   * Top-level modules are separated by a blank line. The result ends with a
   * newline.
   */
  std::string
  print(ast::node_ptr x);

  /** Render \p x as a single expression */
  std::string
  print_expression(ast::node_ptr x);

  std::string
  print_pattern(ast::pattern_ptr p);

  /** Position of an expression in its parent, for parenthesization */
  enum class slot {
    plain,
    operand,
    argument,
    map_value,
  };

  private:
  std::string
  _statements(ast::node_ptr body, int indent);

  std::string
  _statement(ast::node_ptr x, int indent);

  std::string
  _expr(ast::node_ptr x, int indent, slot where = slot::plain);

  std::string
  _args(const ast::node_list &args, int indent);

  std::string
  _operand(ast::node_ptr x, ast::binary_op parent, bool left, int indent);

  std::string
  _iife(ast::node_ptr body, int indent);

  std::string
  _while(ast::node_ptr condition, ast::node_ptr body, int indent);

  std::string
  _module(const ast::node &x, int indent);

  std::string
  _def(const ast::def_node &x, int indent);

  std::string
  _if(const ast::node &x, int indent);

  std::string
  _clauses(const ast::clause_list &clauses, int indent);

  std::string
  _clause_body(ast::node_ptr body, int indent);

  std::string
  _try(const ast::try_node &x, int indent);

  std::string
  _map(const ast::map_node &x, int indent);

  std::string
  _fields(const stl::vector<std::pair<stl::string, ast::node_ptr>> &fields,
          int indent);

  std::string
  _fn(const ast::fn_node &x, int indent);

  std::string
  _for(const ast::for_node &x, int indent);

  std::string
  _assign(const ast::assign_node &x, int indent);

  std::string
  _patterns(const ast::pattern_list &ps);

  private:
  name_generator &m_gensym;
  bool m_exception_module = false;

  friend struct _printer_visitor;
}; // class alm::printer

} // namespace alm
