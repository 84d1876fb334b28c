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
#include "alembic/naming.hpp"
#include "alembic/syntax_table.hpp"
#include "alembic/transform/name_generator.hpp"
#include "alembic/typed/flow_unroller.hpp"
#include "alembic/typed/pattern_library.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * \file tree_builder.hpp
 * Lowering of typed trees into the intermediate AST
 *
 * \ingroup typed
 */


namespace alm {

/**
 * Syntax table over typed forms
 *
 * Calling the builder on a typed expression lowers it; declarations go
 * through build_declaration() or build_unit(). Blocks and loops are offered
 * to the pattern library before the generic rules see them.
 *
 * \ingroup typed
 */
class tree_builder: public syntax_table<ast::node_ptr> {
  public:
  /**
   * \param gensym Fresh-name source of the compilation unit
   * \param name Identifier naming convention
   */
  explicit tree_builder(name_generator &gensym,
                        naming_function name = identifier_name);

  /**
   * Lower a list of declarations into a block of modules
   *
   * Enums are registered before anything is lowered, so that `switch`es on
   * them know the payload arity of every constructor.
   */
  ast::node_ptr
  build_unit(value declarations);

  /**
   * Lower a `class` or `enum` declaration
   *
   * Any other form is lowered as an expression.
   */
  ast::node_ptr
  build_declaration(value decl);

  /** Record the constructors of an `enum` declaration */
  void
  declare_enum(value decl);

  const typed::pattern_context&
  patterns() const noexcept
  { return m_patterns; }

  private:
  ast::node_ptr
  _build_class(value decl);

  ast::node_ptr
  _build_enum(value decl);

  ast::node_ptr
  _build_method(value method);

  ast::node_list
  _build_all(value forms) const;

  ast::node_list
  _build_all_declarations(value decls);

  ast::node_ptr
  _constant(value type, value x) const;

  ast::node_ptr
  _binop(value type, value op, value lhs, value rhs);

  ast::node_ptr
  _arithmetic(value type, value op, value lhs, value rhs) const;

  ast::node_ptr
  _store(value target, ast::node_ptr rhs) const;

  ast::node_ptr
  _coalesce(value lhs, value rhs);

  ast::node_ptr
  _unop(value op, value fix, value operand) const;

  ast::node_ptr
  _field(value object, value name) const;

  ast::node_ptr
  _call(value callee, value args) const;

  ast::node_ptr
  _method_call(value object, value method, value args) const;

  ast::node_ptr
  _loop(value condition, value body) const;

  ast::node_ptr
  _loop_body(value body) const;

  ast::node_ptr
  _switch(value subject, value cases) const;

  ast::node_ptr
  _try(value body, value catches) const;

  ast::pattern_ptr
  _param(value id, value name) const;

  std::string
  _identifier(value name) const;

  /** Target module of a source class, or nothing for the current class */
  std::optional<std::string>
  _module_of(value class_name) const;

  private:
  name_generator &m_gensym;
  naming_function m_name;
  typed::pattern_context m_patterns;
  flow_unroller m_unroller;
  std::string m_class;
  std::unordered_map<std::string, std::vector<int>> m_enums;
}; // class alm::tree_builder

} // namespace alm
