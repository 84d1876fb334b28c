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

#include <gc/gc.h>

#include <cstddef>
#include <new>
#include <utility>
#include <type_traits>

/**
 * \file memory.hpp
 * Garbage-collected allocation
 *
 * Every S-expression cell, AST node, pattern and metadata bag lives on the
 * Boehm GC heap. Nodes are never freed explicitly; rewritten trees share
 * unchanged subtrees with their predecessors.
 *
 * \ingroup memory
 */

/**
 * \namespace alm
 * The main namespace of the Alembic library
 */
namespace alm {

/**
 * Construct an object of type \p T on the collected heap
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make(Args&& ...args)
{
  T* obj = static_cast<T*>(GC_malloc(sizeof(T)));
  new (obj) T {std::forward<Args>(args)...};
  return obj;
}

inline void*
allocate(size_t size)
{ return GC_malloc(size); }

/**
 * Allocate memory the collector never scans for pointers
 *
 * Only valid for data without references to other collected objects.
 */
inline void*
allocate_atomic(size_t size)
{ return GC_malloc_atomic(size); }


/**
 * STL-compatible allocator on top of the collector
 *
 * Containers using it keep their elements reachable for the collector.
 *
 * \ingroup memory
 */
template <typename T>
struct gc_allocator {
  using value_type = T;
  using size_type = size_t;
  using difference_type = ptrdiff_t;
  using propagate_on_container_move_assignment = std::true_type;
  using is_always_equal = std::true_type;

  constexpr gc_allocator() noexcept = default;

  template <typename U>
  constexpr gc_allocator(const gc_allocator<U>&) noexcept { }

  T*
  allocate(size_type n)
  { return static_cast<T*>(alm::allocate(n * sizeof(T))); }

  void
  deallocate(T *p, size_type) noexcept
  { GC_free(p); }

  template <typename U>
  bool
  operator == (const gc_allocator<U>&) const noexcept
  { return true; }
}; // struct alm::gc_allocator

} // namespace alm::detail

template <typename T>
using gc_allocator = gc_allocator_base<T, detail::allocate_wrapper>;

template <typename T>
using atomic_gc_allocator = gc_allocator_base<T, detail::allocate_atomic_wrapper>;

} // namespace alm
