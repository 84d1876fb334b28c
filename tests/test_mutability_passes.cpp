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


class MutabilityTest: public testing::Test {
  protected:
  std::string
  print(node_ptr x)
  { return m_printer.print(x); }

  node_ptr
  lower(node_ptr x)
  { return passes::mutable_lowering(x, m_gensym); }

  static node_ptr
  def(std::string_view name, pattern_list params, node_ptr body)
  {
    return make_node(def_node {
      def_kind::def, stl::string {name}, std::move(params), nullptr, body
    });
  }

  size_t m_counter = 0;
  name_generator m_gensym {m_counter};
  printer m_printer {m_gensym};
};


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                              mutable lowering
TEST_F(MutabilityTest, PushAndPop)
{
  EXPECT_EQ(print(lower(block({
    remote(var("a"), "push", {int_lit(1)})
  }))), "a = a ++ [1]\n");

  EXPECT_EQ(print(lower(block({
    remote(var("a"), "pop")
  }))), "a = List.delete_at(a, -1)\n");

  EXPECT_EQ(print(lower(block({
    bind("x", remote(var("a"), "pop"))
  }))), "x = List.last(a)\na = List.delete_at(a, -1)\n");
}

TEST_F(MutabilityTest, PushOntoInstanceField)
{
  EXPECT_EQ(print(lower(block({
    remote(field(var("struct"), "items"), "push", {var("v")})
  }))), "struct = %{struct | items: struct.items ++ [v]}\n");
}

TEST_F(MutabilityTest, IncrementsAndDecrements)
{
  EXPECT_EQ(print(lower(block({
    unary(unary_op::post_increment, var("i"))
  }))), "i = i + 1\n");

  EXPECT_EQ(print(lower(block({
    bind("x", unary(unary_op::post_increment, var("i")))
  }))), "x = i\ni = i + 1\n");

  EXPECT_EQ(print(lower(block({
    bind("x", unary(unary_op::pre_decrement, var("i")))
  }))), "i = i - 1\nx = i\n");

  EXPECT_EQ(print(lower(block({
    unary(unary_op::pre_increment, field(var("struct"), "count"))
  }))), "struct = %{struct | count: struct.count + 1}\n");
}

TEST_F(MutabilityTest, StoresBecomeMatches)
{
  const node_ptr x = lower(block({
    assign(var("x"), int_lit(1)),
    assign(field(var("struct"), "count"), int_lit(0)),
  }));
  const node_list stmts = statements_of(x);
  ASSERT_EQ(stmts.size(), 2u);
  EXPECT_TRUE(stmts[0]->is<match_node>());
  EXPECT_TRUE(stmts[1]->is<match_node>());
  EXPECT_EQ(print(x), "x = 1\nstruct = %{struct | count: 0}\n");
}

TEST_F(MutabilityTest, OtherReceiversAreLeftAlone)
{
  const node_ptr x = block({
    remote(field(var("other"), "xs"), "push", {int_lit(1)}),
    assign(field(var("obj"), "f"), int_lit(1)),
    unary(unary_op::post_increment, call("counter")),
  });
  EXPECT_EQ(lower(x), x);
}

TEST_F(MutabilityTest, SingleStatementBranchesAreLowered)
{
  EXPECT_EQ(print(lower(block({
    if_(var("c"), remote(var("a"), "push", {int_lit(1)}))
  }))), "if c do\n  a = a ++ [1]\nend\n");
}


TEST_F(MutabilityTest, PopInValuePositionYieldsTheElement)
{
  EXPECT_EQ(print(lower(def("f", {pvar("a")}, remote(var("a"), "pop")))),
            "def f(a) do\n"
            "  temp_1 = List.last(a)\n"
            "  a = List.delete_at(a, -1)\n"
            "  temp_1\n"
            "end\n");

  EXPECT_EQ(print(lower(def("g", {pvar("a")}, block({
    bind("x", remote(var("a"), "pop"))
  })))),
            "def g(a) do\n"
            "  x = List.last(a)\n"
            "  a = List.delete_at(a, -1)\n"
            "  x\n"
            "end\n");
}

TEST_F(MutabilityTest, StepInValuePositionYieldsTheRightCount)
{
  EXPECT_EQ(print(lower(def("f", {pvar("i")},
                            unary(unary_op::post_increment, var("i"))))),
            "def f(i) do\n"
            "  temp_1 = i\n"
            "  i = i + 1\n"
            "  temp_1\n"
            "end\n");

  EXPECT_EQ(print(lower(def("g", {pvar("i")},
                            unary(unary_op::pre_increment, var("i"))))),
            "def g(i) do\n"
            "  i = i + 1\n"
            "  i\n"
            "end\n");
}

TEST_F(MutabilityTest, PushInValuePositionYieldsTheLength)
{
  EXPECT_EQ(print(lower(def("f", {pvar("a")},
                            remote(var("a"), "push", {int_lit(1)})))),
            "def f(a) do\n"
            "  a = a ++ [1]\n"
            "  length(a)\n"
            "end\n");
}

TEST_F(MutabilityTest, MutationInsideAnExpressionIsLiftedOut)
{
  const node_ptr x = lower(block({call("f", {remote(var("a"), "pop")})}));
  EXPECT_EQ(print(passes::effect_lifting(x, m_gensym)),
            "temp_1 = List.last(a)\n"
            "a = List.delete_at(a, -1)\n"
            "f(temp_1)\n");
}

TEST_F(MutabilityTest, LoweredClauseBodyKeepsItsPayloadArity)
{
  metadata meta;
  meta.payload_arity = 1;
  const node_ptr body = with_meta(
    unary(unary_op::post_increment, field(var("struct"), "count")), meta);

  case_node c {call("elem", {var("s"), int_lit(0)}), { }};
  c.clauses.push_back({plit(int_lit(1)), nullptr, body});
  const node_ptr x = block({make_node(std::move(c))});

  const node_ptr lowered = lower(x);
  const case_node *lowered_case = statements_of(lowered).front()->get<case_node>();
  ASSERT_NE(lowered_case, nullptr);
  const auto arity = meta_of(lowered_case->clauses.front().body).payload_arity;
  ASSERT_TRUE(arity.has_value());
  EXPECT_EQ(*arity, 1);

  const node_ptr y = passes::enum_pattern_reconstruction(lowered);
  const case_node *rebuilt = statements_of(y).front()->get<case_node>();
  ASSERT_NE(rebuilt, nullptr);
  const tuple_pattern *p = rebuilt->clauses.front().pattern->get<tuple_pattern>();
  ASSERT_NE(p, nullptr);
  ASSERT_EQ(p->elements.size(), 2u);
  EXPECT_TRUE(p->elements[1]->is<wildcard_pattern>());
  EXPECT_TRUE(rebuilt->clauses.front().body->is<match_node>());
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                          conditional reassignment
TEST_F(MutabilityTest, ConditionalReassignment)
{
  EXPECT_EQ(print(passes::conditional_reassignment(block({
    if_(var("c"), bind("x", binary(binary_op::add, var("x"), int_lit(1))))
  }))), "x = if c, do: x + 1, else: x\n");
}

TEST_F(MutabilityTest, ConditionalReassignmentNeedsSelfReference)
{
  const node_ptr unrelated = block({if_(var("c"), bind("x", int_lit(5)))});
  EXPECT_EQ(passes::conditional_reassignment(unrelated), unrelated);

  const node_ptr with_else = block({
    if_(var("c"), bind("x", binary(binary_op::add, var("x"), int_lit(1))), int_lit(0))
  });
  EXPECT_EQ(passes::conditional_reassignment(with_else), with_else);

  const node_ptr longer = block({
    if_(var("c"), block({call("log"),
                         bind("x", binary(binary_op::add, var("x"), int_lit(1)))}))
  });
  EXPECT_EQ(passes::conditional_reassignment(longer), longer);
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                             redundant nil init
TEST_F(MutabilityTest, NilInitOverwrittenBeforeReadIsDropped)
{
  EXPECT_EQ(print(passes::redundant_nil_init(block({
    bind("x", nil_lit()), bind("x", call("f")), var("x")
  }))), "x = f()\nx\n");

  EXPECT_EQ(print(passes::redundant_nil_init(block({
    bind("x", nil_lit()), bind("x", nil_lit()), bind("x", int_lit(1)), var("x")
  }))), "x = 1\nx\n");
}

TEST_F(MutabilityTest, NilInitReadBeforeOverwriteIsKept)
{
  const node_ptr read_first = block({
    bind("x", nil_lit()), call("f", {var("x")}), bind("x", int_lit(1)), var("x")
  });
  EXPECT_EQ(passes::redundant_nil_init(read_first), read_first);

  const node_ptr self_reference = block({
    bind("x", nil_lit()), bind("x", binary(binary_op::add, var("x"), int_lit(1)))
  });
  EXPECT_EQ(passes::redundant_nil_init(self_reference), self_reference);

  const node_ptr conditional = block({
    bind("x", nil_lit()), if_(var("c"), bind("x", int_lit(1))), var("x")
  });
  EXPECT_EQ(passes::redundant_nil_init(conditional), conditional);

  const node_ptr never_overwritten = block({bind("x", nil_lit()), var("x")});
  EXPECT_EQ(passes::redundant_nil_init(never_overwritten), never_overwritten);
}


// <<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>><<+>>
//                             statement context
TEST_F(MutabilityTest, DiscardedFunctionalUpdateIsRebound)
{
  const node_ptr x = def("f", {pvar("m")}, block({
    remote("Map", "put", {var("m"), atom("k"), int_lit(1)}),
    var("m")
  }));
  EXPECT_EQ(print(passes::statement_context(x)),
            "def f(m) do\n"
            "  m = Map.put(m, :k, 1)\n"
            "  m\n"
            "end\n");
}

TEST_F(MutabilityTest, DiscardedContextReachesBranches)
{
  const node_ptr x = def("f", {pvar("m"), pvar("c")}, block({
    if_(var("c"), remote("Map", "delete", {var("m"), atom("k")})),
    var("m")
  }));
  EXPECT_EQ(print(passes::statement_context(x)),
            "def f(m, c) do\n"
            "  if c do\n"
            "    m = Map.delete(m, :k)\n"
            "  end\n"
            "  m\n"
            "end\n");
}

TEST_F(MutabilityTest, UsedValuesAreNotRebound)
{
  const node_ptr bound = def("f", {pvar("m")}, block({
    bind("y", remote("Map", "put", {var("m"), atom("k"), int_lit(1)})),
    var("y")
  }));
  EXPECT_EQ(passes::statement_context(bound), bound);

  const node_ptr returned = def("f", {pvar("m")},
    remote("Map", "put", {var("m"), atom("k"), int_lit(1)}));
  EXPECT_EQ(passes::statement_context(returned), returned);

  const node_ptr argument = def("f", {pvar("m")}, block({
    call("g", {remote("Map", "put", {var("m"), atom("k"), int_lit(1)})}),
    var("m")
  }));
  EXPECT_EQ(passes::statement_context(argument), argument);
}

TEST_F(MutabilityTest, OnlyVariableReceiversAreRebound)
{
  const node_ptr x = def("f", { }, block({
    remote("Map", "put", {call("g"), atom("k"), int_lit(1)}),
    remote("Enum", "map", {var("xs"), var("f")}),
    nil_lit()
  }));
  EXPECT_EQ(passes::statement_context(x), x);
}

TEST_F(MutabilityTest, FunctionalUpdateFamily)
{
  EXPECT_TRUE(passes::is_functional_update("Map", "put"));
  EXPECT_TRUE(passes::is_functional_update("List", "delete_at"));
  EXPECT_TRUE(passes::is_functional_update("String", "replace"));
  EXPECT_TRUE(passes::is_functional_update("Map", "update!"));
  EXPECT_TRUE(passes::is_functional_update("Keyword", "update"));
  EXPECT_FALSE(passes::is_functional_update("Enum", "map"));
  EXPECT_FALSE(passes::is_functional_update("Map", "get"));
}

} // anonymous namespace
