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


#include "alembic/typed/pattern_library.hpp"
#include "alembic/typed/tree_builder.hpp"
#include "alembic/printer/printer.hpp"
#include "alembic/sexpr_parser.hpp"

#include <gtest/gtest.h>
#include <string>


namespace {

using namespace alm;
using namespace alm::ast;


// Test fixture lowering idioms with a real tree builder
class PatternLibraryTest: public testing::Test {
  protected:
  std::string
  lower(value x)
  {
    const node_ptr result = typed::lower_idiom(x, m_builder.patterns());
    return result ? m_printer.print_expression(result) : "<no idiom>";
  }

  size_t m_counter = 0;
  name_generator m_gensym {m_counter};
  tree_builder m_builder {m_gensym};
  printer m_printer {m_gensym};
};


value
inlined_call()
{
  return R"(
  (block Int
    (var (Null Int) 7 tmp
      (call (Null Int) (field Dynamic (local (Class Foo) 1 obj) getX)))
    (if Int (binop Bool != (local (Null Int) 7 tmp) (const (Null Int) ()))
        (local Int 7 tmp)
        (const Int 0)))
  )"_sexpr;
}

value
unrolled_map()
{
  return R"(
  (block (Array Int)
    (var (Array Int) 1 res (array (Array Int)))
    (var Int 2 i (const Int 0))
    (while Void
        (binop Bool < (local Int 2 i) (field Int (local (Array Int) 9 xs) length))
      (block Void
        (var Int 3 x (index Int (local (Array Int) 9 xs) (local Int 2 i)))
        (unop Int ++ postfix (local Int 2 i))
        (call Void (field Void (local (Array Int) 1 res) push)
                   (binop Int * (local Int 3 x) (const Int 2)))))
    (local (Array Int) 1 res))
  )"_sexpr;
}


TEST_F(PatternLibraryTest, InlinedAccessorWithImpureInit)
{
  EXPECT_TRUE(typed::is<typed::inlined_accessor>(inlined_call()));
  EXPECT_EQ(lower(inlined_call()),
            "if (tmp = Foo.get_x(obj)) != nil, do: tmp, else: 0");
}

TEST_F(PatternLibraryTest, InlinedAccessorWithPureInitIsSubstituted)
{
  const value x = R"(
    (block Int
      (var (Null Int) 7 tmp (field Int (local (Class Foo) 1 obj) x))
      (if Int (binop Bool != (local (Null Int) 7 tmp) (const (Null Int) ()))
          (local Int 7 tmp)
          (const Int 0)))
  )"_sexpr;
  EXPECT_EQ(lower(x), "if obj.x != nil, do: obj.x, else: 0");
}

TEST_F(PatternLibraryTest, ExtractAgreesWithDetection)
{
  const auto f = typed::extract<typed::inlined_accessor>(inlined_call());
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(f->id, 7);
  EXPECT_TRUE(f->temp == "tmp");
  EXPECT_FALSE(f->tests_null);

  EXPECT_FALSE(typed::is<typed::null_coalescing>(inlined_call()));
  EXPECT_FALSE(typed::extract<typed::null_coalescing>(inlined_call()).has_value());
  EXPECT_FALSE(typed::is<typed::unrolled_collection_loop>(inlined_call()));
}

TEST_F(PatternLibraryTest, InlinedAccessorNeedsEqualityTest)
{
  const value x = R"(
    (block Int
      (var (Null Int) 7 tmp (call (Null Int) (static Dynamic Foo get)))
      (if Int (binop Bool < (local (Null Int) 7 tmp) (const (Null Int) ()))
          (local Int 7 tmp)
          (const Int 0)))
  )"_sexpr;
  EXPECT_FALSE(typed::is<typed::inlined_accessor>(x));
  EXPECT_FALSE(typed::extract<typed::inlined_accessor>(x).has_value());
}

TEST_F(PatternLibraryTest, NullCoalescing)
{
  const value x = R"(
    (block Int
      (var (Null Int) 3 t (call (Null Int) (static Dynamic Foo lookup)))
      (binop Int ?? (local (Null Int) 3 t) (const Int 5)))
  )"_sexpr;
  EXPECT_TRUE(typed::is<typed::null_coalescing>(x));
  EXPECT_FALSE(typed::is<typed::inlined_accessor>(x));
  EXPECT_EQ(lower(x), "if (t = Foo.lookup()) != nil, do: t, else: 5");
}

TEST_F(PatternLibraryTest, NullCoalescingRequiresTheSameTemporary)
{
  const value x = R"(
    (block Int
      (var (Null Int) 3 t (call (Null Int) (static Dynamic Foo lookup)))
      (binop Int ?? (local (Null Int) 4 u) (const Int 5)))
  )"_sexpr;
  EXPECT_FALSE(typed::is<typed::null_coalescing>(x));
}

TEST_F(PatternLibraryTest, UnrolledMap)
{
  const auto f = typed::extract<typed::unrolled_collection_loop>(unrolled_map());
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(f->element_id, 3);
  EXPECT_FALSE(f->condition.has_value());
  EXPECT_EQ(lower(unrolled_map()), "for x <- xs, do: x * 2");
}

TEST_F(PatternLibraryTest, UnrolledFilter)
{
  const value x = R"(
    (block (Array Int)
      (var (Array Int) 1 res (array (Array Int)))
      (var Int 2 i (const Int 0))
      (while Void
          (binop Bool < (local Int 2 i) (field Int (local (Array Int) 9 xs) length))
        (block Void
          (var Int 3 x (index Int (local (Array Int) 9 xs) (local Int 2 i)))
          (unop Int ++ postfix (local Int 2 i))
          (if Void (binop Bool > (local Int 3 x) (const Int 0))
            (call Void (field Void (local (Array Int) 1 res) push)
                       (local Int 3 x)))))
      (local (Array Int) 1 res))
  )"_sexpr;
  EXPECT_EQ(lower(x), "for x <- xs, x > 0, do: x");
}

TEST_F(PatternLibraryTest, UnrolledLoopReadingTheIndexIsRejected)
{
  const value x = R"(
    (block (Array Int)
      (var (Array Int) 1 res (array (Array Int)))
      (var Int 2 i (const Int 0))
      (while Void
          (binop Bool < (local Int 2 i) (field Int (local (Array Int) 9 xs) length))
        (block Void
          (var Int 3 x (index Int (local (Array Int) 9 xs) (local Int 2 i)))
          (unop Int ++ postfix (local Int 2 i))
          (call Void (field Void (local (Array Int) 1 res) push)
                     (local Int 2 i))))
      (local (Array Int) 1 res))
  )"_sexpr;
  EXPECT_FALSE(typed::is<typed::unrolled_collection_loop>(x));
  EXPECT_FALSE(typed::extract<typed::unrolled_collection_loop>(x).has_value());
}

TEST_F(PatternLibraryTest, UnrolledLoopMustReturnItsResult)
{
  const value x = R"(
    (block (Array Int)
      (var (Array Int) 1 res (array (Array Int)))
      (var Int 2 i (const Int 0))
      (while Void
          (binop Bool < (local Int 2 i) (field Int (local (Array Int) 9 xs) length))
        (block Void
          (var Int 3 x (index Int (local (Array Int) 9 xs) (local Int 2 i)))
          (unop Int ++ postfix (local Int 2 i))
          (call Void (field Void (local (Array Int) 1 res) push) (local Int 3 x))))
      (local (Array Int) 9 xs))
  )"_sexpr;
  EXPECT_FALSE(typed::is<typed::unrolled_collection_loop>(x));
}

TEST_F(PatternLibraryTest, IteratorProtocol)
{
  const value x = R"(
    (block Void
      (var Dynamic 1 it
        (call Dynamic (field Dynamic (local (Map String Int) 5 m) keyValueIterator)))
      (while Void (call Bool (field Dynamic (local Dynamic 1 it) hasNext))
        (block Void
          (var Dynamic 2 g (call Dynamic (field Dynamic (local Dynamic 1 it) next)))
          (var String 3 k (field String (local Dynamic 2 g) key))
          (var Int 4 v (field Int (local Dynamic 2 g) value))
          (call Void (static Dynamic Log trace) (local String 3 k) (local Int 4 v)))))
  )"_sexpr;

  const auto f = typed::extract<typed::iterator_protocol>(x);
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(f->key_id, 3);
  EXPECT_EQ(f->value_id, 4);
  EXPECT_EQ(lower(x), "Enum.each(m, fn {k, v} ->\n  Log.trace(k, v)\nend)");
}

TEST_F(PatternLibraryTest, IteratorLeakingIntoBodyIsRejected)
{
  const value x = R"(
    (block Void
      (var Dynamic 1 it
        (call Dynamic (field Dynamic (local (Map String Int) 5 m) keyValueIterator)))
      (while Void (call Bool (field Dynamic (local Dynamic 1 it) hasNext))
        (block Void
          (var Dynamic 2 g (call Dynamic (field Dynamic (local Dynamic 1 it) next)))
          (var String 3 k (field String (local Dynamic 2 g) key))
          (var Int 4 v (field Int (local Dynamic 2 g) value))
          (call Void (static Dynamic Log trace) (local Dynamic 2 g)))))
  )"_sexpr;
  EXPECT_FALSE(typed::is<typed::iterator_protocol>(x));
}

TEST_F(PatternLibraryTest, MultiTempAccessorInlinesBothSides)
{
  const value x = R"(
    (block Bool
      (var (Null Int) 1 a (call (Null Int) (static Dynamic Foo first)))
      (var (Null Int) 2 b (call (Null Int) (static Dynamic Foo second)))
      (binop Bool ==
        (if Int (binop Bool != (local (Null Int) 1 a) (const (Null Int) ()))
            (local Int 1 a) (const Int 0))
        (if Int (binop Bool != (local (Null Int) 2 b) (const (Null Int) ()))
            (local Int 2 b) (const Int 0))))
  )"_sexpr;
  EXPECT_TRUE(typed::is<typed::multi_temp_accessor>(x));
  EXPECT_FALSE(typed::is<typed::inlined_accessor>(x));
  EXPECT_EQ(lower(x),
            "(if (a = Foo.first()) != nil, do: a, else: 0) == "
            "(if (b = Foo.second()) != nil, do: b, else: 0)");
}

TEST_F(PatternLibraryTest, MultiTempAccessorSubstitutesPureInits)
{
  const value x = R"(
    (block Bool
      (var (Null Int) 1 a (field Int (local (Class Foo) 5 obj) x))
      (var (Null Int) 2 b (field Int (local (Class Foo) 5 obj) y))
      (binop Bool <
        (if Int (binop Bool == (local (Null Int) 1 a) (const (Null Int) ()))
            (const Int 0) (local Int 1 a))
        (if Int (binop Bool != (local (Null Int) 2 b) (const (Null Int) ()))
            (local Int 2 b) (const Int 0))))
  )"_sexpr;
  EXPECT_EQ(lower(x),
            "(if obj.x == nil, do: 0, else: obj.x) < "
            "(if obj.y != nil, do: obj.y, else: 0)");
}

TEST_F(PatternLibraryTest, MultiTempAccessorKeepsBindingsWhenOrderMatters)
{
  const value x = R"(
    (block Bool
      (var (Null Int) 1 a (call (Null Int) (static Dynamic Foo first)))
      (var (Null Int) 2 b (call (Null Int) (static Dynamic Foo second)))
      (binop Bool ==
        (if Int (binop Bool != (local (Null Int) 1 a) (const (Null Int) ()))
            (local Int 1 a) (call Int (static Dynamic Foo fallback)))
        (if Int (binop Bool != (local (Null Int) 2 b) (const (Null Int) ()))
            (local Int 2 b) (const Int 0))))
  )"_sexpr;
  ASSERT_TRUE(typed::is<typed::multi_temp_accessor>(x));
  const node_ptr result = typed::lower_idiom(x, m_builder.patterns());
  ASSERT_NE(result, nullptr);
  const block_node *b = result->get<block_node>();
  ASSERT_NE(b, nullptr);
  ASSERT_EQ(b->statements.size(), 3u);
  EXPECT_EQ(m_printer.print_expression(b->statements[0]), "a = Foo.first()");
  EXPECT_EQ(m_printer.print_expression(b->statements[1]), "b = Foo.second()");
  EXPECT_EQ(m_printer.print_expression(b->statements[2]),
            "(if a != nil, do: a, else: Foo.fallback()) == "
            "(if b != nil, do: b, else: 0)");
}

TEST_F(PatternLibraryTest, MultiTempAccessorNeedsNullTestsOfItsTemporaries)
{
  const value x = R"(
    (block Bool
      (var Int 1 a (call Int (static Dynamic Foo f)))
      (var Int 2 b (call Int (static Dynamic Foo g)))
      (binop Bool == (if Int (local Bool 3 c) (local Int 1 a) (const Int 0))
                     (if Int (local Bool 4 d) (local Int 2 b) (const Int 0))))
  )"_sexpr;
  EXPECT_FALSE(typed::is<typed::multi_temp_accessor>(x));
  EXPECT_EQ(lower(x), "<no idiom>");

  const value swapped = R"(
    (block Bool
      (var (Null Int) 1 a (call (Null Int) (static Dynamic Foo first)))
      (var (Null Int) 2 b (call (Null Int) (static Dynamic Foo second)))
      (binop Bool ==
        (if Int (binop Bool != (local (Null Int) 2 b) (const (Null Int) ()))
            (local Int 2 b) (const Int 0))
        (if Int (binop Bool != (local (Null Int) 1 a) (const (Null Int) ()))
            (local Int 1 a) (const Int 0))))
  )"_sexpr;
  EXPECT_FALSE(typed::is<typed::multi_temp_accessor>(swapped));
}

TEST_F(PatternLibraryTest, MultiTempAccessorNeedsComparison)
{
  const value x = R"(
    (block Int
      (var Int 1 a (const Int 1))
      (var Int 2 b (const Int 2))
      (binop Int + (if Int (local Bool 3 c) (local Int 1 a) (local Int 2 b))
                   (if Int (local Bool 3 c) (local Int 2 b) (local Int 1 a))))
  )"_sexpr;
  EXPECT_FALSE(typed::is<typed::multi_temp_accessor>(x));
}

TEST_F(PatternLibraryTest, OrdinaryFormsAreNoIdiom)
{
  EXPECT_EQ(lower("(block Int (const Int 1))"_sexpr), "<no idiom>");
  EXPECT_EQ(lower("(const Int 1)"_sexpr), "<no idiom>");
}

} // anonymous namespace
