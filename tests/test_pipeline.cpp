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


#include "alembic/compiler.hpp"
#include "alembic/sexpr_parser.hpp"

#include <gtest/gtest.h>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>


namespace {

using namespace alm;


TEST(Pipeline, PassesRunInDefaultOrder)
{
  size_t counter = 0;
  name_generator gensym {counter};
  const pipeline p {pipeline_config { }, gensym};

  const auto &names = pipeline::default_pass_names();
  ASSERT_EQ(p.passes().size(), names.size());
  for (size_t i = 0; i < names.size(); ++i)
  {
    EXPECT_EQ(p.passes()[i].name, names[i]);
    EXPECT_TRUE(p.passes()[i].enabled);
  }
  EXPECT_EQ(names.front(), "clause-local-resolution");
  EXPECT_EQ(names.back(), "bitwise-import");
}

TEST(Pipeline, PassesCanBeDisabledByName)
{
  size_t counter = 0;
  name_generator gensym {counter};

  pipeline_config config;
  config.disable("usage-hygiene");
  const pipeline p {config, gensym};
  for (const pass &x : p.passes())
    EXPECT_EQ(x.enabled, x.name != "usage-hygiene") << x.name;

  pipeline_config unknown;
  unknown.disable("constant-folding");
  EXPECT_THROW((pipeline {unknown, gensym}), std::invalid_argument);
}


class CompileTest: public testing::Test {
  protected:
  static std::string
  compile(const std::string &text, pipeline_config config = { })
  { return compile_unit(text, "<test>", std::move(config)); }

  // Brackets nest and every `do` or `fn` has its `end`, outside strings
  static bool
  is_balanced(std::string_view text)
  {
    std::string stack;
    size_t blocks = 0;
    std::string word;
    const auto flush = [&](char next) {
      bool ok = true;
      if ((word == "do" and next != ':') or word == "fn")
        ++blocks;
      else if (word == "end")
      {
        ok = blocks > 0;
        --blocks;
      }
      word.clear();
      return ok;
    };

    for (size_t i = 0; i < text.size(); ++i)
    {
      const char c = text[i];
      if (std::isalnum(static_cast<unsigned char>(c)) or c == '_')
      {
        word.push_back(c);
        continue;
      }
      if (not flush(c))
        return false;

      if (c == '"')
      {
        for (++i; i < text.size() and text[i] != '"'; ++i)
        {
          if (text[i] == '\\')
            ++i;
        }
        if (i >= text.size())
          return false;
      }
      else if (c == '(' or c == '[' or c == '{')
        stack.push_back(c);
      else if (c == ')' or c == ']' or c == '}')
      {
        const char open = c == ')' ? '(' : c == ']' ? '[' : '{';
        if (stack.empty() or stack.back() != open)
          return false;
        stack.pop_back();
      }
    }
    return flush('\n') and stack.empty() and blocks == 0;
  }
};


TEST_F(CompileTest, InstanceFieldIncrement)
{
  EXPECT_EQ(compile(R"(
    (class Counter ()
      (field count Int (const Int 0))
      (method public instance bump ()
        (block (Class Counter)
          (unop Int ++ postfix (field Int (this (Class Counter)) count))
          (return (Class Counter) (this (Class Counter))))))
  )"),
            "defmodule Counter do\n"
            "  defstruct [count: 0]\n"
            "\n"
            "  def bump(struct) do\n"
            "    struct = %{struct | count: struct.count + 1}\n"
            "    struct\n"
            "  end\n"
            "end\n");
}

TEST_F(CompileTest, SwitchOnEnumBecomesTupleMatch)
{
  EXPECT_EQ(compile(R"(
    (enum Shape (ctor Circle (r)) (ctor Square (side)))
    (class Geometry ()
      (method public static area ((1 s (Enum Shape)))
        (switch Float (enum-index Int (local (Enum Shape) 1 s))
          (case ((const Int 0))
            (block Float
              (var Float 2 r (enum-param Float (local (Enum Shape) 1 s) Circle 0))
              (binop Float * (binop Float * (local Float 2 r) (local Float 2 r))
                             (const Float 3.14))))
          (case ((const Int 1))
            (block Float
              (var Float 3 side (enum-param Float (local (Enum Shape) 1 s) Square 0))
              (binop Float * (local Float 3 side) (local Float 3 side)))))))
  )"),
            "defmodule Shape do\n"
            "  def circle(r), do: {0, r}\n"
            "\n"
            "  def square(side), do: {1, side}\n"
            "end\n"
            "\n"
            "defmodule Geometry do\n"
            "  def area(s) do\n"
            "    case s do\n"
            "      {0, r} -> r * r * 3.14\n"
            "      {1, side} -> side * side\n"
            "    end\n"
            "  end\n"
            "end\n");
}

TEST_F(CompileTest, BitwiseModulesRequireBitwise)
{
  const std::string text = R"(
    (class Flags ((doc "Bit flags"))
      (method public static mask ((1 x Int))
        (binop Int & (local Int 1 x) (const Int 255))))
  )";
  EXPECT_EQ(compile(text),
            "defmodule Flags do\n"
            "  @moduledoc \"Bit flags\"\n"
            "\n"
            "  require Bitwise\n"
            "\n"
            "  def mask(x), do: Bitwise.band(x, 255)\n"
            "end\n");

  pipeline_config config;
  config.disable("bitwise-import");
  EXPECT_EQ(compile(text, config),
            "defmodule Flags do\n"
            "  @moduledoc \"Bit flags\"\n"
            "\n"
            "  def mask(x), do: Bitwise.band(x, 255)\n"
            "end\n");
}

TEST_F(CompileTest, UnusedPrivateFunctionsAreSuppressed)
{
  EXPECT_EQ(compile(R"(
    (class Util ()
      (method private static unusedHelper ((1 a Int)) (const Int 1))
      (method public static run () (const Int 2)))
  )"),
            "defmodule Util do\n"
            "  @compile {:nowarn_unused_function, [unused_helper: 1]}\n"
            "\n"
            "  defp unused_helper(_a), do: 1\n"
            "\n"
            "  def run, do: 2\n"
            "end\n");
}

TEST_F(CompileTest, UnrolledLoopBecomesComprehension)
{
  EXPECT_EQ(compile(R"(
    (class Grid ()
      (method public static indices ()
        (meta (Array Int) unrolled
          (block (Array Int)
            (var (Array Int) 1 g (array (Array Int)))
            (call Void (field Dynamic (local (Array Int) 1 g) push) (const Int 0))
            (call Void (field Dynamic (local (Array Int) 1 g) push) (const Int 1))
            (call Void (field Dynamic (local (Array Int) 1 g) push) (const Int 2))
            (local (Array Int) 1 g)))))
  )"),
            "defmodule Grid do\n"
            "  def indices do\n"
            "    for i <- 0..2, do: i\n"
            "  end\n"
            "end\n");
}

TEST_F(CompileTest, WhileLoopBecomesRecursiveClosure)
{
  EXPECT_EQ(compile(R"(
    (class Loop ()
      (method public static countdown ((1 n Int))
        (block Int
          (while Void (binop Bool > (local Int 1 n) (const Int 0))
            (block Void (unop Int -- postfix (local Int 1 n))))
          (return Int (local Int 1 n)))))
  )"),
            "defmodule Loop do\n"
            "  def countdown(n) do\n"
            "    while_loop_1 = fn while_loop_1 ->\n"
            "      if n > 0 do\n"
            "        n = n - 1\n"
            "        while_loop_1.(while_loop_1)\n"
            "      else\n"
            "        :ok\n"
            "      end\n"
            "    end\n"
            "    while_loop_1.(while_loop_1)\n"
            "    n\n"
            "  end\n"
            "end\n");
}

TEST_F(CompileTest, ReturnedMutationsYieldTheirValue)
{
  EXPECT_EQ(compile(R"(
    (class Stack ()
      (method public static top ((1 a (Array Int)))
        (block Int
          (return Int (call Int (field Int (local (Array Int) 1 a) pop))))))
  )"),
            "defmodule Stack do\n"
            "  def top(a) do\n"
            "    temp_1 = List.last(a)\n"
            "    a = List.delete_at(a, -1)\n"
            "    temp_1\n"
            "  end\n"
            "end\n");

  EXPECT_EQ(compile(R"(
    (class Ticker ()
      (method public static next ((1 i Int))
        (block Int (return Int (unop Int ++ postfix (local Int 1 i))))))
  )"),
            "defmodule Ticker do\n"
            "  def next(i) do\n"
            "    temp_1 = i\n"
            "    i = i + 1\n"
            "    temp_1\n"
            "  end\n"
            "end\n");
}

TEST_F(CompileTest, AccessorInitializersAreNotDropped)
{
  const std::string text = compile(R"(
    (class Pair ()
      (method public static same ((3 c Bool) (4 d Bool))
        (block Bool
          (var Int 1 a (call Int (static Dynamic Foo f)))
          (var Int 2 b (call Int (static Dynamic Foo g)))
          (binop Bool == (if Int (local Bool 3 c) (local Int 1 a) (const Int 0))
                         (if Int (local Bool 4 d) (local Int 2 b) (const Int 0))))))
  )");
  EXPECT_NE(text.find("a = Foo.f()"), std::string::npos) << text;
  EXPECT_NE(text.find("b = Foo.g()"), std::string::npos) << text;
}

TEST_F(CompileTest, OutputDelimitersAreBalanced)
{
  const std::string text = compile(R"(
    (enum Shape (ctor Circle (r)) (ctor Square (side)))
    (class Zoo ((doc "Mixed (forms) [with] {text}"))
      (field items (Array Int) (array (Array Int)))
      (method public static area ((1 s (Enum Shape)))
        (switch Float (enum-index Int (local (Enum Shape) 1 s))
          (case ((const Int 0))
            (block Float
              (var Float 2 r (enum-param Float (local (Enum Shape) 1 s) Circle 0))
              (binop Float * (local Float 2 r) (local Float 2 r))))
          (default (const Float 0))))
      (method public static countdown ((1 n Int))
        (block Int
          (while Void (binop Bool > (local Int 1 n) (const Int 0))
            (block Void (unop Int -- postfix (local Int 1 n))))
          (return Int (local Int 1 n))))
      (method public instance add ((1 v Int))
        (block (Class Zoo)
          (call Void (field Dynamic (field (Array Int) (this (Class Zoo)) items) push)
                     (local Int 1 v))
          (return (Class Zoo) (this (Class Zoo))))))
  )");
  EXPECT_TRUE(is_balanced(text)) << text;
}

TEST_F(CompileTest, ErrorsPropagate)
{
  EXPECT_THROW(compile("(class Broken ()"), parse_error);
  EXPECT_THROW(compile("(frobnicate Int)"), bad_code);

  pipeline_config config;
  config.disable("no-such-pass");
  EXPECT_THROW(compile("(class Empty ())", config), std::invalid_argument);
}

} // anonymous namespace
