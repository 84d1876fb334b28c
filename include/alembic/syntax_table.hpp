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

#include "alembic/match.hpp"
#include "alembic/exceptions.hpp"
#include "alembic/stl.hpp"

#include <concepts>
#include <functional>
#include <list>
#include <ranges>
#include <utility>

/**
 * \file syntax_table.hpp
 * Rule tables dispatching S-expression forms to translations
 *
 * \ingroup sexpr
 */


namespace alm {

/**
 * Ordered table of syntax rules producing values of type \p Result
 *
 * Each rule pairs a matcher with a translation. Applying the table tries the
 * rules in order and runs the translation of the first rule whose matcher
 * accepts the form. Rules added after flip_page() take priority over all
 * rules added before it.
 *
 * Usage example:
 * ```
 * syntax_table<value> table;
 * table.append_rule({list("add"), "(add x y)"_sexpr}, [](const auto &ms) {
 *   return list("+", ms.at("x"), ms.at("y"));
 * });
 * table("(add 1 2)"_sexpr); // => (+ 1 2)
 * ```
 *
 * \ingroup sexpr
 */
template <typename Result>
class syntax_table {
  public:
  using translation = std::function<Result(const match_mapping&, value)>;

  syntax_table() { m_pages.emplace_front(); }
  syntax_table(const syntax_table&) = delete;
  syntax_table& operator = (const syntax_table&) = delete;

  /**
   * Add a rule with the highest priority
   */
  void
  prepend_rule(const match &matcher, const translation &rule)
  { m_pages.front().emplace_front(matcher, rule); }

  template <typename RuleNoForm>
    requires std::regular_invocable<RuleNoForm, const match_mapping&>
  void
  prepend_rule(const match &matcher, RuleNoForm rule)
  { prepend_rule(matcher, [=](const auto &ms, value) { return rule(ms); }); }

  /**
   * Add a rule with the lowest priority on the current page
   */
  void
  append_rule(const match &matcher, const translation &rule)
  { m_pages.front().emplace_back(matcher, rule); }

  template <typename RuleNoForm>
    requires std::regular_invocable<RuleNoForm, const match_mapping&>
  void
  append_rule(const match &matcher, RuleNoForm rule)
  { append_rule(matcher, [=](const auto &ms, value) { return rule(ms); }); }

  void
  flip_page()
  { m_pages.emplace_front(); }

  /**
   * Translate \p form with the first matching rule
   *
   * \throws code_transformation_error If no rule matches
   */
  Result
  operator () (value form) const
  {
    match_mapping matches;
    for (const auto &[matcher, rule] : m_pages | std::views::join)
    {
      if (matches.clear(), matcher(form, matches))
        return rule(matches, form);
    }
    throw code_transformation_error {
        std::format("no syntax rule matches the expression {}", form), form};
  }

  private:
  using rule_list = stl::deque<std::pair<match, translation>>;
  std::list<rule_list, gc_allocator<rule_list>> m_pages;
}; // class alm::syntax_table

} // namespace alm
