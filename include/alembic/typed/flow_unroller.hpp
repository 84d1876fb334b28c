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

#include "alembic/value.hpp"

/**
 * \file flow_unroller.hpp
 * Early-return elimination on the typed tree
 *
 * \ingroup typed
 */


namespace alm {

/**
 * Rewrite early returns into conditionals
 *
 * Within every `block`, a conditional one of whose branches always returns
 * swallows the statements following it into its other branch:
 * \code
 * (block T (if _ c (return _ a)) rest...)
 *   => (block T (if _ c (return _ a) (block T rest...)))
 * \endcode
 * Statements following an unconditional `return` are dropped. Returns left
 * in tail position are lowered to their value by the tree builder.
 *
 * Returns nested in loops are left in place.
 */
class flow_unroller {
  public:
  value
  operator () (value form) const;

  private:
  value
  _unroll_block(value block) const;
}; // class alm::flow_unroller

} // namespace alm
