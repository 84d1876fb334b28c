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


#include "alembic/transform/passes.hpp"
#include "alembic/ast/analysis.hpp"
#include "alembic/ast/construct.hpp"
#include "alembic/printer/printer.hpp"

#include <gtest/gtest.h>
#include <string>


namespace {

using namespace alm;
using namespace alm::ast;


class HygieneTest: public testing::Test {
  protected:
  std::string
  print(node_ptr x)
  { return m_printer.print(x); }

  static node_ptr
  def(std::string_view name, pattern_list params, node_ptr body,
      def_kind kind = def_kind::def)
  {
    return make_node(def_node {
      kind, stl::string {name}, std::move(params), nullptr, body
    });
  }

  static node_ptr
  module(std::string_view name, node_list body)
  { return make_node(module_node {stl::string {name}, std::move(body)}); }

  size_t m_counter = 0;
  name_generator m_gensym {m_counter};
  printer m_printer {m_gensym};
};


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                               usage hygiene
TEST_F(HygieneTest, UnusedBindingsAreIgnored)
{
  EXPECT_EQ(print(passes::usage_hygiene(def("f", { }, block({
    bind("x", call("g")), int_lit(1)
  })))),
            "def f do\n"
            "  _x = g()\n"
            "  1\n"
            "end\n");

  EXPECT_EQ(print(passes::usage_hygiene(def("f", {pvar("a")}, int_lit(1)))),
            "def f(_a), do: 1\n");
}

TEST_F(HygieneTest, UsedUnderscoredBindingsAreStripped)
{
  EXPECT_EQ(print(passes::usage_hygiene(def("f", { }, block({
    bind("_y", int_lit(1)), var("_y")
  })))),
            "def f do\n"
            "  y = 1\n"
            "  y\n"
            "end\n");
}

TEST_F(HygieneTest, SelfReferenceIsNotAUse)
{
  EXPECT_EQ(print(passes::usage_hygiene(def("f", { }, block({
    bind("x", int_lit(1)),
    bind("x", binary(binary_op::add, var("x"), int_lit(1))),
    nil_lit()
  })))),
            "def f do\n"
            "  _x = 1\n"
            "  _x = _x + 1\n"
            "  nil\n"
            "end\n");
}

TEST_F(HygieneTest, Idempotent)
{
  const node_ptr x = def("f", {pvar("a"), pvar("_b")}, block({
    bind("x", call("g", {var("_b")})),
    bind("_c", int_lit(2)),
    var("_c")
  }));
  const node_ptr once = passes::usage_hygiene(x);
  const node_ptr twice = passes::usage_hygiene(once);
  EXPECT_EQ(dump(once), dump(twice));
  EXPECT_EQ(print(once),
            "def f(_a, b) do\n"
            "  _x = g(b)\n"
            "  c = 2\n"
            "  c\n"
            "end\n");
}

TEST_F(HygieneTest, StrippingNeverProducesReservedOrTakenNames)
{
  const node_ptr reserved = def("f", { }, block({bind("_end", int_lit(1)), var("_end")}));
  EXPECT_EQ(passes::usage_hygiene(reserved), reserved);

  const node_ptr generated = def("f", { }, block({bind("__x", int_lit(1)), var("__x")}));
  EXPECT_EQ(passes::usage_hygiene(generated), generated);

  const node_ptr taken = def("f", { }, block({
    bind("_y", int_lit(1)),
    bind("y", int_lit(2)),
    binary(binary_op::add, var("_y"), var("y"))
  }));
  EXPECT_EQ(passes::usage_hygiene(taken), taken);
}

TEST_F(HygieneTest, EachDefinitionIsItsOwnScope)
{
  const node_ptr x = module("M", {
    def("f", {pvar("x")}, var("x")),
    def("g", { }, block({bind("x", int_lit(1)), int_lit(2)})),
  });
  EXPECT_EQ(print(passes::usage_hygiene(x)),
            "defmodule M do\n"
            "  def f(x), do: x\n"
            "\n"
            "  def g do\n"
            "    _x = 1\n"
            "    2\n"
            "  end\n"
            "end\n");
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                         unused private functions
TEST_F(HygieneTest, UncalledPrivateFunctionsAreRecorded)
{
  const node_ptr x = module("M", {
    def("dead", {pvar("a")}, int_lit(1), def_kind::defp),
    def("used", { }, int_lit(2), def_kind::defp),
    def("run", { }, call("used")),
  });
  const node_ptr y = passes::unused_private_functions(x);
  const auto &unused = meta_of(y).unused_private_functions;
  ASSERT_EQ(unused.size(), 1u);
  EXPECT_TRUE(unused.front().first == "dead");
  EXPECT_EQ(unused.front().second, 1u);

  EXPECT_EQ(print(y),
            "defmodule M do\n"
            "  @compile {:nowarn_unused_function, [dead: 1]}\n"
            "\n"
            "  defp dead(a), do: 1\n"
            "\n"
            "  defp used, do: 2\n"
            "\n"
            "  def run, do: used()\n"
            "end\n");
}

TEST_F(HygieneTest, CallsMustMatchTheArity)
{
  const node_ptr x = module("M", {
    def("helper", {pvar("a")}, var("a"), def_kind::defp),
    def("run", { }, call("helper")),
  });
  const auto &unused = meta_of(passes::unused_private_functions(x)).unused_private_functions;
  ASSERT_EQ(unused.size(), 1u);
  EXPECT_TRUE(unused.front().first == "helper");
}

TEST_F(HygieneTest, RecursionDoesNotCountAsACall)
{
  const node_ptr x = module("M", {
    def("loop", {pvar("n")}, call("loop", {var("n")}), def_kind::defp),
  });
  EXPECT_EQ(meta_of(passes::unused_private_functions(x)).unused_private_functions.size(), 1u);

  const node_ptr all_used = module("M", {
    def("helper", { }, int_lit(1), def_kind::defp),
    def("run", { }, call("helper")),
  });
  EXPECT_EQ(passes::unused_private_functions(all_used), all_used);
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                              bitwise import
TEST_F(HygieneTest, BitwiseRequireFollowsTheModuledoc)
{
  const node_ptr x = module("Flags", {
    make_node(attribute_node {"moduledoc", str_lit("Bit flags")}),
    def("mask", {pvar("x")}, binary(binary_op::band, var("x"), int_lit(255))),
  });
  const node_ptr y = passes::bitwise_import(x);
  const module_node *m = y->get<module_node>();
  ASSERT_NE(m, nullptr);
  ASSERT_EQ(m->body.size(), 3u);
  const directive_node *d = m->body[1]->get<directive_node>();
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->kind, directive_kind::require);
  EXPECT_TRUE(d->module == "Bitwise");

  EXPECT_EQ(print(y),
            "defmodule Flags do\n"
            "  @moduledoc \"Bit flags\"\n"
            "\n"
            "  require Bitwise\n"
            "\n"
            "  def mask(x), do: Bitwise.band(x, 255)\n"
            "end\n");
}

TEST_F(HygieneTest, BitwiseRequireIsAddedOnce)
{
  const node_ptr plain = module("M", {def("f", {pvar("x")}, var("x"))});
  EXPECT_EQ(passes::bitwise_import(plain), plain);

  const node_ptr once = passes::bitwise_import(module("M", {
    def("f", {pvar("x")}, unary(unary_op::bnot, var("x")))
  }));
  EXPECT_EQ(passes::bitwise_import(once), once);
  EXPECT_TRUE(once->get<module_node>()->body.front()->is<directive_node>());
}

} // anonymous namespace
