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


#include "alembic/typed/tree_builder.hpp"
#include "alembic/ast/construct.hpp"
#include "alembic/printer/printer.hpp"
#include "alembic/sexpr_parser.hpp"
#include "alembic/transform/passes.hpp"

#include <gtest/gtest.h>
#include <string>


namespace {

using namespace alm;
using namespace alm::ast;


// Test fixture for lowering typed forms
class TreeBuilderTest: public testing::Test {
  protected:
  std::string
  expr(value x)
  { return m_printer.print_expression(m_builder(x)); }

  std::string
  declaration(value x)
  { return m_printer.print(m_builder.build_declaration(x)); }

  size_t m_counter = 0;
  name_generator m_gensym {m_counter};
  tree_builder m_builder {m_gensym};
  printer m_printer {m_gensym};
};


TEST_F(TreeBuilderTest, Constants)
{
  EXPECT_EQ(expr("(const Int 1)"_sexpr), "1");
  EXPECT_EQ(expr("(const Int -3)"_sexpr), "-3");
  EXPECT_EQ(expr("(const Float 2)"_sexpr), "2.0");
  EXPECT_EQ(expr("(const Float 2.5)"_sexpr), "2.5");
  EXPECT_EQ(expr("(const Dynamic 0.5)"_sexpr), "0.5");
  EXPECT_EQ(expr(R"((const String "a"))"_sexpr), R"("a")");
  EXPECT_EQ(expr("(const Bool #t)"_sexpr), "true");
  EXPECT_EQ(expr("(const (Null Int) ())"_sexpr), "nil");
}

TEST_F(TreeBuilderTest, OutOfRangeConstantsAreRejected)
{
  EXPECT_THROW(m_builder("(const Float 1e5000)"_sexpr), bad_code);
  EXPECT_THROW(m_builder("(const Float -1e5000)"_sexpr), bad_code);
}

TEST_F(TreeBuilderTest, Locals)
{
  EXPECT_EQ(expr("(local Int 1 itemCount)"_sexpr), "item_count");
  EXPECT_EQ(expr("(local Int 1 end)"_sexpr), "end_");
  EXPECT_EQ(expr("(this (Class Point))"_sexpr), "struct");
  EXPECT_EQ(expr("(var Int 1 x)"_sexpr), "x = nil");
  EXPECT_EQ(expr("(var Int 1 x (const Int 2))"_sexpr), "x = 2");

  const node_ptr x = m_builder("(local Int 42 x)"_sexpr);
  ASSERT_TRUE(meta_of(x).source_id.has_value());
  EXPECT_EQ(*meta_of(x).source_id, 42);
}

TEST_F(TreeBuilderTest, BinaryOperators)
{
  EXPECT_EQ(expr("(binop Int + (local Int 1 a) (local Int 2 b))"_sexpr), "a + b");
  EXPECT_EQ(expr("(binop Float / (local Int 1 a) (local Int 2 b))"_sexpr), "a / b");
  EXPECT_EQ(expr("(binop Int % (local Int 1 a) (local Int 2 b))"_sexpr), "rem(a, b)");
  EXPECT_EQ(expr("(binop Int & (local Int 1 a) (const Int 255))"_sexpr),
            "Bitwise.band(a, 255)");
  EXPECT_EQ(expr("(binop Int >>> (local Int 1 a) (const Int 2))"_sexpr),
            "Bitwise.bsr(a, 2)");
  EXPECT_EQ(expr("(binop Bool && (local Bool 1 a) (local Bool 2 b))"_sexpr),
            "a && b");
  EXPECT_EQ(expr(R"((binop String + (local String 1 a) (const String "x")))"_sexpr),
            R"(a <> "x")");
  EXPECT_EQ(expr(R"((binop String + (const String "n=") (local Int 1 n)))"_sexpr),
            R"("n=" <> n)");
}

TEST_F(TreeBuilderTest, UnknownOperatorsAreRejected)
{
  EXPECT_THROW(m_builder("(binop Int <=> (local Int 1 a) (local Int 2 b))"_sexpr),
               bad_code);
  EXPECT_THROW(m_builder("(unop Int ? prefix (local Int 1 a))"_sexpr), bad_code);
  EXPECT_THROW(m_builder("(unop Int - infix (local Int 1 a))"_sexpr), bad_code);
}

TEST_F(TreeBuilderTest, Assignments)
{
  EXPECT_EQ(expr("(binop Int = (local Int 1 x) (const Int 1))"_sexpr), "x = 1");
  EXPECT_EQ(expr("(binop Int += (local Int 1 x) (const Int 2))"_sexpr),
            "x = x + 2");
  EXPECT_EQ(expr("(binop Int <<= (local Int 1 x) (const Int 1))"_sexpr),
            "x = Bitwise.bsl(x, 1)");
  EXPECT_EQ(expr("(binop Int = (field Int (this (Class P)) x) (const Int 1))"_sexpr),
            "struct = %{struct | x: 1}");
  EXPECT_EQ(expr(R"((binop Int = (index Int (local (Map String Int) 1 m) (const String "k"))
                                 (const Int 1)))"_sexpr),
            R"(m = Map.put(m, "k", 1))");
  EXPECT_THROW(m_builder("(binop Int = (const Int 1) (const Int 2))"_sexpr), bad_code);
}

TEST_F(TreeBuilderTest, NullCoalescing)
{
  EXPECT_EQ(expr("(binop Int ?? (local (Null Int) 1 a) (const Int 0))"_sexpr),
            "if a != nil, do: a, else: 0");
  EXPECT_EQ(expr("(binop Int ?? (call (Null Int) (static Dynamic Foo get)) (const Int 0))"_sexpr),
            "if (tmp_1 = Foo.get()) != nil, do: tmp_1, else: 0");
}

TEST_F(TreeBuilderTest, UnaryOperators)
{
  EXPECT_EQ(expr("(unop Bool ! prefix (local Bool 1 b))"_sexpr), "!b");
  EXPECT_EQ(expr("(unop Int - prefix (local Int 1 x))"_sexpr), "-x");
  EXPECT_EQ(expr("(unop Int ~ prefix (local Int 1 x))"_sexpr), "Bitwise.bnot(x)");

  const node_ptr inc = m_builder("(unop Int ++ postfix (local Int 1 i))"_sexpr);
  ASSERT_TRUE(inc->is<unary_node>());
  EXPECT_EQ(inc->get<unary_node>()->op, unary_op::post_increment);

  const node_ptr dec = m_builder("(unop Int -- prefix (local Int 1 i))"_sexpr);
  ASSERT_TRUE(dec->is<unary_node>());
  EXPECT_EQ(dec->get<unary_node>()->op, unary_op::pre_decrement);
}

TEST_F(TreeBuilderTest, FieldsAndIndexing)
{
  EXPECT_EQ(expr("(field Int (local (Class Point) 1 p) posX)"_sexpr), "p.pos_x");
  EXPECT_EQ(expr("(field Int (local (Array Int) 1 xs) length)"_sexpr), "length(xs)");
  EXPECT_EQ(expr("(field Int (local String 1 s) length)"_sexpr), "String.length(s)");
  EXPECT_EQ(expr("(index Int (local (Array Int) 1 xs) (const Int 0))"_sexpr),
            "Enum.at(xs, 0)");
  EXPECT_EQ(expr(R"((index Int (local (Map String Int) 1 m) (const String "k")))"_sexpr),
            R"(Map.get(m, "k"))");
}

TEST_F(TreeBuilderTest, LibraryMethods)
{
  EXPECT_EQ(expr("(call Int (field Dynamic (local (Array Int) 1 xs) indexOf) (const Int 3))"_sexpr),
            "Enum.find_index(xs, fn item -> item == 3 end)");
  EXPECT_EQ(expr("(call Bool (field Dynamic (local (Array Int) 1 xs) contains) (const Int 3))"_sexpr),
            "Enum.member?(xs, 3)");
  EXPECT_EQ(expr("(call (Array Int) (field Dynamic (local (Array Int) 1 xs) concat) (local (Array Int) 2 ys))"_sexpr),
            "xs ++ ys");
  EXPECT_EQ(expr("(call Void (field Dynamic (local (Array Int) 1 xs) push) (const Int 1))"_sexpr),
            "xs.push(1)");
  EXPECT_EQ(expr(R"((call Void (field Dynamic (local (Map String Int) 1 m) set) (const String "k") (const Int 1)))"_sexpr),
            R"(Map.put(m, "k", 1))");
  EXPECT_EQ(expr("(call String (field Dynamic (local String 1 s) toUpperCase))"_sexpr),
            "String.upcase(s)");
}

TEST_F(TreeBuilderTest, UnsupportedLibraryMethodIsRejected)
{
  EXPECT_THROW(m_builder("(call Void (field Dynamic (local (Array Int) 1 xs) frobnicate))"_sexpr),
               bad_code);
  EXPECT_THROW(m_builder("(call Void (field Dynamic (local String 1 s) shout))"_sexpr),
               bad_code);
}

TEST_F(TreeBuilderTest, Calls)
{
  EXPECT_EQ(expr("(call Int (field Dynamic (local (Class Point) 1 p) norm))"_sexpr),
            "Point.norm(p)");
  EXPECT_EQ(expr("(call Int (field Dynamic (this (Class Point)) norm))"_sexpr),
            "norm(struct)");
  EXPECT_EQ(expr("(call Int (field Dynamic (local Dynamic 1 o) run) (const Int 1))"_sexpr),
            "o.run.(1)");
  EXPECT_EQ(expr(R"((call Void (static Void Log info) (const String "hi")))"_sexpr),
            R"(Log.info("hi"))");
  EXPECT_EQ(expr("(call Int (local Dynamic 1 f) (const Int 2))"_sexpr), "f.(2)");
  EXPECT_EQ(expr("(new (Class Point) Point (const Int 1) (const Int 2))"_sexpr),
            "Point.new(1, 2)");
  EXPECT_EQ(expr(R"((throw Void (new (Class ParseError) ParseError (const String "bad"))))"_sexpr),
            R"(raise(ParseError.new("bad")))");
}

TEST_F(TreeBuilderTest, DataLiterals)
{
  EXPECT_EQ(expr("(array (Array Int) (const Int 1) (const Int 2))"_sexpr), "[1, 2]");
  EXPECT_EQ(expr(R"((object Dynamic (name (const String "a")) (ageYears (const Int 3))))"_sexpr),
            R"(%{name: "a", age_years: 3})");
  EXPECT_EQ(expr(R"x((raw Dynamic "IO.puts(1)"))x"_sexpr), "IO.puts(1)");
  EXPECT_EQ(expr("(cast Int (local Dynamic 1 x))"_sexpr), "x");
  EXPECT_EQ(expr("(paren Int (local Int 1 x))"_sexpr), "(x)");
}

TEST_F(TreeBuilderTest, Closures)
{
  EXPECT_EQ(expr("(fn Dynamic ((1 x Int)) (binop Int * (local Int 1 x) (const Int 2)))"_sexpr),
            "fn x -> x * 2 end");
  EXPECT_THROW(m_builder("(fn Dynamic ((x)) (const Int 1))"_sexpr), bad_code);
}

TEST_F(TreeBuilderTest, Conditionals)
{
  EXPECT_EQ(expr("(if Int (local Bool 1 c) (const Int 1) (const Int 2))"_sexpr),
            "if c, do: 1, else: 2");
  EXPECT_EQ(expr("(if Void (local Bool 1 c) (call Void (static Void Foo run)))"_sexpr),
            "if c, do: Foo.run()");
}

TEST_F(TreeBuilderTest, MetaForms)
{
  const node_ptr unrolled = m_builder(
    "(meta (Array Int) unrolled (block (Array Int) (local (Array Int) 1 g)))"_sexpr);
  EXPECT_TRUE(meta_of(unrolled).unrolled_loop);

  const node_ptr inlined = m_builder(
    "(meta Int inline (if Int (local Bool 1 c) (const Int 1) (const Int 2)))"_sexpr);
  EXPECT_TRUE(meta_of(inlined).keep_inline);

  const node_ptr other = m_builder("(meta Int pure (local Int 1 x))"_sexpr);
  EXPECT_FALSE(meta_of(other).keep_inline);
  EXPECT_FALSE(meta_of(other).unrolled_loop);
}

TEST_F(TreeBuilderTest, WhileLoopBecomesPlaceholder)
{
  const node_ptr x = m_builder(R"(
    (while Void (binop Bool < (local Int 1 i) (const Int 3))
      (block Void (unop Int ++ postfix (local Int 1 i))))
  )"_sexpr);
  const call_node *c = x->get<call_node>();
  ASSERT_NE(c, nullptr);
  EXPECT_TRUE(c->name == printer::while_placeholder);
  ASSERT_EQ(c->args.size(), 2u);
  EXPECT_TRUE(c->args[1]->is<block_node>());
}

TEST_F(TreeBuilderTest, BreakWrapsTheLoop)
{
  const node_ptr x = m_builder(R"(
    (while Void (const Bool #t) (block Void (break Void)))
  )"_sexpr);
  const try_node *t = x->get<try_node>();
  ASSERT_NE(t, nullptr);
  ASSERT_EQ(t->catches.size(), 1u);
  EXPECT_EQ(m_printer.print_pattern(t->catches.front().kind), ":throw");
  EXPECT_EQ(m_printer.print_pattern(t->catches.front().value), ":break");
  EXPECT_EQ(m_printer.print_expression(t->catches.front().body), ":ok");

  const call_node *loop = t->body->get<call_node>();
  ASSERT_NE(loop, nullptr);
  EXPECT_TRUE(loop->name == printer::while_placeholder);
  EXPECT_EQ(m_printer.print_expression(loop->args[1]), "throw(:break)");
}

TEST_F(TreeBuilderTest, ContinueWrapsTheBody)
{
  const node_ptr x = m_builder(R"(
    (while Void (local Bool 1 c)
      (block Void
        (if Void (local Bool 2 d) (continue Void))
        (call Void (static Void Foo run))))
  )"_sexpr);
  const call_node *loop = x->get<call_node>();
  ASSERT_NE(loop, nullptr);
  const try_node *t = loop->args[1]->get<try_node>();
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(m_printer.print_pattern(t->catches.front().value), ":continue");
}

TEST_F(TreeBuilderTest, ControlInNestedLoopsStaysThere)
{
  const node_ptr x = m_builder(R"(
    (while Void (local Bool 1 c)
      (block Void
        (while Void (local Bool 2 d) (block Void (break Void)))))
  )"_sexpr);
  const call_node *outer = x->get<call_node>();
  ASSERT_NE(outer, nullptr);
  const node_ptr inner = statements_of(outer->args[1]).front();
  EXPECT_TRUE(inner->is<try_node>());
}

TEST_F(TreeBuilderTest, ForIn)
{
  EXPECT_EQ(expr(R"(
    (for-in Void 1 x (local (Array Int) 2 xs)
      (call Void (static Void Log info) (local Int 1 x)))
  )"_sexpr), "for x <- xs, do: Log.info(x)");
}

TEST_F(TreeBuilderTest, SwitchOnEnumCarriesPayloadArity)
{
  m_builder.declare_enum("(enum Shape (ctor Circle (r)) (ctor Rect (w h)))"_sexpr);
  const node_ptr x = m_builder(R"(
    (switch Float (enum-index Int (local (Enum Shape) 1 s))
      (case ((const Int 0))
        (block Float
          (var Float 2 r (enum-param Float (local (Enum Shape) 1 s) Circle 0))
          (local Float 2 r)))
      (case ((const Int 1))
        (block Float
          (var Float 3 w (enum-param Float (local (Enum Shape) 1 s) Rect 0))
          (local Float 3 w)))
      (default (const Float 0)))
  )"_sexpr);

  const case_node *c = x->get<case_node>();
  ASSERT_NE(c, nullptr);
  ASSERT_EQ(c->clauses.size(), 3u);
  EXPECT_EQ(meta_of(c->clauses[0].body).payload_arity, 1);
  EXPECT_EQ(meta_of(c->clauses[1].body).payload_arity, 2);
  EXPECT_EQ(m_printer.print_expression(c->subject), "elem(s, 0)");

  EXPECT_EQ(m_printer.print_expression(passes::enum_pattern_reconstruction(x)),
            "case s do\n"
            "  {0, r} -> r\n"
            "  {1, w, _} -> w\n"
            "  _ -> 0.0\n"
            "end");
}

TEST_F(TreeBuilderTest, SwitchCases)
{
  const node_ptr x = m_builder(R"(
    (switch String (local Int 1 n)
      (case ((const Int 1) (const Int 2)) (const String "small"))
      (case ((const Int 7)) (local Int 9 radius) (alias (9 radius)))
      (default (const String "other")))
  )"_sexpr);
  const case_node *c = x->get<case_node>();
  ASSERT_NE(c, nullptr);
  ASSERT_EQ(c->clauses.size(), 4u);
  EXPECT_EQ(m_printer.print_pattern(c->clauses[0].pattern), "1");
  EXPECT_EQ(m_printer.print_pattern(c->clauses[1].pattern), "2");
  EXPECT_EQ(m_printer.print_expression(c->clauses[1].body), "\"small\"");
  EXPECT_FALSE(meta_of(c->clauses[0].body).payload_arity.has_value());

  const auto &names = meta_of(c->clauses[2].body).clause_names;
  ASSERT_EQ(names.count(9), 1u);
  EXPECT_TRUE(names.at(9) == "radius");

  EXPECT_THROW(m_builder("(switch Int (local Int 1 n) (otherwise (const Int 1)))"_sexpr),
               bad_code);
}

TEST_F(TreeBuilderTest, TryCatch)
{
  EXPECT_EQ(expr(R"(
    (try Void (call Void (static Void Foo run))
      (catch 1 e (Class ArgumentError) (const Int 0))
      (catch 2 err Dynamic (const Int 1)))
  )"_sexpr),
            "try do\n"
            "  Foo.run()\n"
            "rescue\n"
            "  e in ArgumentError -> 0\n"
            "  err -> 1\n"
            "end");
}

TEST_F(TreeBuilderTest, EnumDeclaration)
{
  EXPECT_EQ(declaration("(enum Shape (ctor Circle (r)) (ctor Rect (w h)))"_sexpr),
            "defmodule Shape do\n"
            "  def circle(r), do: {0, r}\n"
            "\n"
            "  def rect(w, h), do: {1, w, h}\n"
            "end\n");
  EXPECT_EQ(expr("(enum-ctor (Enum Shape) Shape Circle (const Float 1.5))"_sexpr),
            "Shape.circle(1.5)");
  EXPECT_EQ(expr("(enum-param Float (local (Enum Shape) 1 s) Rect 1)"_sexpr),
            "elem(s, 2)");
}

TEST_F(TreeBuilderTest, ClassDeclaration)
{
  EXPECT_EQ(declaration(R"(
    (class Point ((doc "A point"))
      (field x Int (const Int 0))
      (field y Int (const Int 0))
      (method public static new ((1 x Int) (2 y Int))
        (block Void
          (binop Int = (field Int (this (Class Point)) x) (local Int 1 x))
          (binop Int = (field Int (this (Class Point)) y) (local Int 2 y))))
      (method public instance norm ()
        (return Int (binop Int + (field Int (this (Class Point)) x)
                                 (field Int (this (Class Point)) y))))
      (method private static origin ()
        (new (Class Point) Point (const Int 0) (const Int 0))))
  )"_sexpr),
            "defmodule Point do\n"
            "  @moduledoc \"A point\"\n"
            "\n"
            "  defstruct [x: 0, y: 0]\n"
            "\n"
            "  def new(x, y) do\n"
            "    struct = %__MODULE__{}\n"
            "    struct = %{struct | x: x}\n"
            "    struct = %{struct | y: y}\n"
            "    struct\n"
            "  end\n"
            "\n"
            "  def norm(struct), do: struct.x + struct.y\n"
            "\n"
            "  defp origin, do: new(0, 0)\n"
            "end\n");
}

TEST_F(TreeBuilderTest, ExceptionDeclaration)
{
  const node_ptr x = m_builder.build_declaration(
    "(class ParseError (exception) (field message String))"_sexpr);
  EXPECT_TRUE(meta_of(x).is_exception);
  EXPECT_EQ(m_printer.print(x),
            "defmodule ParseError do\n"
            "  defexception [message: nil]\n"
            "end\n");
}

TEST_F(TreeBuilderTest, EarlyReturnInMethod)
{
  EXPECT_EQ(declaration(R"(
    (class Check ()
      (method public static sign ((1 n Int))
        (block Int
          (if Void (binop Bool < (local Int 1 n) (const Int 0))
            (return Int (const Int -1)))
          (return Int (const Int 1)))))
  )"_sexpr),
            "defmodule Check do\n"
            "  def sign(n) do\n"
            "    if n < 0 do\n"
            "      -1\n"
            "    else\n"
            "      1\n"
            "    end\n"
            "  end\n"
            "end\n");
}

TEST_F(TreeBuilderTest, BuildUnitRegistersEnumsFirst)
{
  const node_ptr unit = m_builder.build_unit(R"(
    ((class Geometry ()
       (method public static tag ((1 s (Enum Shape)))
         (switch Int (enum-index Int (local (Enum Shape) 1 s))
           (case ((const Int 0)) (const Int 10)))))
     (enum Shape (ctor Circle (r))))
  )"_sexpr);
  const node_list modules = statements_of(unit);
  ASSERT_EQ(modules.size(), 2u);

  const def_node *tag = modules[0]->get<module_node>()->body.front()->get<def_node>();
  ASSERT_NE(tag, nullptr);
  const case_node *c = tag->body->get<case_node>();
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(meta_of(c->clauses.front().body).payload_arity, 1);
}

TEST_F(TreeBuilderTest, MalformedFormsAreRejected)
{
  EXPECT_THROW(m_builder("(frobnicate Int)"_sexpr), code_transformation_error);
  EXPECT_THROW(m_builder("(local Int x 1)"_sexpr), bad_code);
  EXPECT_THROW(m_builder.build_declaration("(class A () (method public static f))"_sexpr),
               bad_code);
  EXPECT_THROW(m_builder.build_declaration("(class A () (method hidden static f () (const Int 1)))"_sexpr),
               bad_code);
  EXPECT_THROW(m_builder.build_declaration("(class A (final))"_sexpr), bad_code);
  EXPECT_THROW(m_builder.build_declaration("(enum E (Circle))"_sexpr), bad_code);
}

} // anonymous namespace
