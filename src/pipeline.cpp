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


#include "alembic/transform/pipeline.hpp"
#include "alembic/transform/passes.hpp"
#include "alembic/logging.hpp"
#include "alembic/utilities/execution_timer.hpp"

#include <algorithm>
#include <stdexcept>


namespace alm {

const std::vector<std::string_view>&
pipeline::default_pass_names()
{
  static const std::vector<std::string_view> names {
    "clause-local-resolution",
    "temp-binding-collapse",
    "mutable-lowering",
    "conditional-reassignment",
    "redundant-nil-init",
    "statement-context",
    "loop-reconstruction",
    "enum-pattern-reconstruction",
    "effect-lifting",
    "usage-hygiene",
    "unused-private-functions",
    "bitwise-import",
  };
  return names;
}


pipeline::pipeline(pipeline_config config, name_generator &gensym)
{
  const std::vector<std::function<ast::node_ptr(ast::node_ptr)>> runs {
    passes::clause_local_resolution,
    passes::temp_binding_collapse,
    [&gensym](ast::node_ptr root) {
      return passes::mutable_lowering(root, gensym);
    },
    passes::conditional_reassignment,
    passes::redundant_nil_init,
    passes::statement_context,
    [&gensym](ast::node_ptr root) {
      return passes::loop_reconstruction(root, gensym);
    },
    passes::enum_pattern_reconstruction,
    [&gensym](ast::node_ptr root) {
      return passes::effect_lifting(root, gensym);
    },
    passes::usage_hygiene,
    passes::unused_private_functions,
    passes::bitwise_import,
  };

  const auto &names = default_pass_names();
  for (size_t i = 0; i < names.size(); ++i)
    m_passes.push_back({std::string {names[i]}, true, runs[i]});

  for (const std::string &name : config.disabled())
  {
    const auto it = std::ranges::find(m_passes, name, &pass::name);
    if (it == m_passes.end())
      throw std::invalid_argument {std::format("unknown pass '{}'", name)};
    it->enabled = false;
    warning("pass {} is disabled, output may not compile", name);
  }
}


ast::node_ptr
pipeline::transform(ast::node_ptr root) const
{
  for (const pass &p : m_passes)
  {
    if (not p.enabled)
    {
      debug("skip pass \e[1m{}\e[0m", p.name);
      continue;
    }

    debug("run pass \e[1m{}\e[0m", p.name);
    indent _ {};
    execution_timer timer {p.name};
    root = p.run(root);
  }
  return root;
}

} // namespace alm
