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
#include "alembic/exceptions.hpp"
#include "alembic/match.hpp"
#include "alembic/naming.hpp"

#include <concepts>
#include <functional>
#include <optional>
#include <string_view>

/**
 * \file pattern_library.hpp
 * Recognizers for idioms left in the typed tree by upstream desugaring
 *
 * Each idiom is a class with a fixed-depth \ref match pattern, a side
 * condition on the bindings, a reader turning the bindings into its Fields
 * and a transformation into the intermediate AST. The free functions is(),
 * extract() and transform() are the public contract; is() and extract() run
 * the same matcher and side condition, so they never disagree.
 *
 * \ingroup typed
 */


namespace alm::typed {

/**
 * Collaborators supplied to pattern transformations
 *
 * \ingroup typed
 */
struct pattern_context {
  /** Lower a typed sub-expression */
  std::function<ast::node_ptr(value)> build;
  /** Map a source identifier to a target identifier */
  naming_function name;
}; // struct alm::typed::pattern_context


template <typename T>
concept idiom = requires(const match_mapping &ms, const typename T::fields &f,
                         const pattern_context &ctx)
{
  { T::name } -> std::convertible_to<std::string_view>;
  { T::matcher() } -> std::convertible_to<const match&>;
  { T::accepts(ms) } -> std::convertible_to<bool>;
  { T::read(ms) } -> std::same_as<typename T::fields>;
  { T::transform(f, ctx) } -> std::convertible_to<ast::node_ptr>;
};


/**
 * Accessor inlined with a null guard
 *
 * \code
 * (block _ (var _ id tmp init)
 *          (if _ (binop _ ==|!= (local _ id tmp) (const _ ())) a b))
 * \endcode
 */
struct inlined_accessor {
  static constexpr std::string_view name = "inlined-accessor";

  struct fields {
    long id;
    value temp;
    value init;
    bool tests_null; /**< `==` rather than `!=` */
    value when_true, when_false;
  };

  static const match& matcher();
  static bool accepts(const match_mapping &ms);
  static fields read(const match_mapping &ms);
  static ast::node_ptr transform(const fields &f, const pattern_context &ctx);
}; // struct alm::typed::inlined_accessor


/**
 * Two inlined accessors compared with each other
 *
 * \code
 * (block _ (var _ id1 t1 e1) (var _ id2 t2 e2)
 *          (binop _ cmp (if _ (binop _ ==|!= (local _ id1 t1) (const _ ())) a1 b1)
 *                       (if _ (binop _ ==|!= (local _ id2 t2) (const _ ())) a2 b2)))
 * \endcode
 *
 * Each side becomes an inlined accessor. If `e2` has effects and the
 * branches of the first guard may have effects too, both temporaries stay
 * bound ahead of the comparison.
 */
struct multi_temp_accessor {
  static constexpr std::string_view name = "multi-temp-accessor";

  struct fields {
    inlined_accessor::fields first, second;
    value comparison;
  };

  static const match& matcher();
  static bool accepts(const match_mapping &ms);
  static fields read(const match_mapping &ms);
  static ast::node_ptr transform(const fields &f, const pattern_context &ctx);
}; // struct alm::typed::multi_temp_accessor


/**
 * Null-coalescing test of a temporary
 *
 * \code
 * (block _ (var _ id tmp init) (binop _ ?? (local _ id tmp) fallback))
 * \endcode
 */
struct null_coalescing {
  static constexpr std::string_view name = "null-coalescing";

  struct fields {
    long id;
    value temp;
    value init;
    value fallback;
  };

  static const match& matcher();
  static bool accepts(const match_mapping &ms);
  static fields read(const match_mapping &ms);
  static ast::node_ptr transform(const fields &f, const pattern_context &ctx);
}; // struct alm::typed::null_coalescing


/**
 * Unrolled `map` or `filter` over an array
 *
 * \code
 * (block _
 *   (var _ rid res (array _))
 *   (var _ iid idx (const _ 0))
 *   (while _ (binop _ < (local _ iid idx) (field _ arr length))
 *     (block _
 *       (var _ eid elem (index _ arr (local _ iid idx)))
 *       (unop _ ++ fix (local _ iid idx))
 *       push))
 *   (local _ rid res))
 * \endcode
 *
 * where `push` is `(call _ (field _ (local _ rid res) push) e)`, optionally
 * under `(if _ cond push)`.
 */
struct unrolled_collection_loop {
  static constexpr std::string_view name = "unrolled-collection-loop";

  struct fields {
    long element_id;
    value element;
    value collection;
    std::optional<value> condition;
    value body;
  };

  static const match& matcher();
  static bool accepts(const match_mapping &ms);
  static fields read(const match_mapping &ms);
  static ast::node_ptr transform(const fields &f, const pattern_context &ctx);
}; // struct alm::typed::unrolled_collection_loop


/**
 * Key-value iteration through the external iterator protocol
 *
 * \code
 * (block _
 *   (var _ iid it (call _ (field _ coll keyValueIterator)))
 *   (while _ (call _ (field _ (local _ iid it) hasNext))
 *     (block _
 *       (var _ gid g (call _ (field _ (local _ iid it) next)))
 *       (var _ kid k (field _ (local _ gid g) key))
 *       (var _ vid v (field _ (local _ gid g) value))
 *       body ...)))
 * \endcode
 */
struct iterator_protocol {
  static constexpr std::string_view name = "iterator-protocol";

  struct fields {
    value collection;
    long key_id, value_id;
    value key, value_name;
    value body;
  };

  static const match& matcher();
  static bool accepts(const match_mapping &ms);
  static fields read(const match_mapping &ms);
  static ast::node_ptr transform(const fields &f, const pattern_context &ctx);
}; // struct alm::typed::iterator_protocol


/**
 * Test \p x against \p P
 */
template <idiom P>
bool
is(value x)
{
  match_mapping ms;
  return P::matcher()(x, ms) and P::accepts(ms);
}

/**
 * Fields of \p P in \p x, or nothing if \p x is not an instance of \p P
 */
template <idiom P>
std::optional<typename P::fields>
extract(value x)
{
  match_mapping ms;
  if (not P::matcher()(x, ms) or not P::accepts(ms))
    return std::nullopt;
  return P::read(ms);
}

template <idiom P>
ast::node_ptr
transform(const typename P::fields &f, const pattern_context &ctx)
{ return P::transform(f, ctx); }


/**
 * Lower \p x through the first idiom it is an instance of
 *
 * \return nullptr if \p x is no known idiom
 * \throws internal_defect If an extractor rejects a form its predicate
 *         accepted
 */
ast::node_ptr
lower_idiom(value x, const pattern_context &ctx);

} // namespace alm::typed
