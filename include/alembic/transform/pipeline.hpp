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

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file pipeline.hpp
 * Ordered sequence of tree-rewrite passes
 *
 * \ingroup transform
 */


namespace alm {

/**
 * Named tree rewrite
 *
 * \ingroup transform
 */
struct pass {
  std::string name;
  bool enabled = true;
  std::function<ast::node_ptr(ast::node_ptr)> run;
}; // struct alm::pass


/**
 * Pass enablement
 *
 * Everything is enabled unless disabled by name.
 *
 * \ingroup transform
 */
class pipeline_config {
  public:
  void
  disable(std::string_view pass)
  { m_disabled.emplace(pass); }

  bool
  is_disabled(std::string_view pass) const
  { return m_disabled.contains(std::string {pass}); }

  const std::set<std::string>&
  disabled() const noexcept
  { return m_disabled; }

  private:
  std::set<std::string> m_disabled;
}; // class alm::pipeline_config


/**
 * Transformation pipeline
 *
 * Folds every enabled pass over the tree in list order. Each pass runs under
 * an execution_timer named after it.
 *
 * \ingroup transform
 */
class pipeline {
  public:
  /**
   * Default pass list configured by \p config
   *
   * \param gensym Fresh-name source of the compilation unit
   * \throws std::invalid_argument If \p config names an unknown pass
   */
  pipeline(pipeline_config config, name_generator &gensym);

  pipeline(const pipeline&) = delete;
  pipeline& operator = (const pipeline&) = delete;

  /** Names of the passes of the default pipeline, in order */
  static const std::vector<std::string_view>&
  default_pass_names();

  [[nodiscard]] ast::node_ptr
  transform(ast::node_ptr root) const;

  const std::vector<pass>&
  passes() const noexcept
  { return m_passes; }

  private:
  std::vector<pass> m_passes;
}; // class alm::pipeline

} // namespace alm
