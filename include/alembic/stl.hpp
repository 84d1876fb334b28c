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

#include "alembic/memory.hpp"

#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/**
 * \file stl.hpp
 * Standard containers backed by the collector
 *
 * Any container that stores pointers into the collected heap must come from
 * here: memory of plain std:: containers is not scanned by the collector.
 *
 * \ingroup memory
 */


namespace alm::stl {

template <typename T>
using vector = std::vector<T, gc_allocator<T>>;

template <typename T>
using deque = std::deque<T, gc_allocator<T>>;

using string = std::basic_string<char, std::char_traits<char>, gc_allocator<char>>;

/**
 * Transparent hash usable with both stl::string and std::string_view keys
 */
struct string_hash {
  using is_transparent = void;

  size_t
  operator () (std::string_view s) const noexcept
  { return std::hash<std::string_view> { }(s); }
}; // struct alm::stl::string_hash

template <
  typename Key,
  typename T,
  typename Hash = std::hash<Key>,
  typename KeyEqual = std::equal_to<Key>
>
using unordered_map = std::unordered_map<Key, T, Hash, KeyEqual,
                                         gc_allocator<std::pair<const Key, T>>>;

template <
  typename Key,
  typename Hash = std::hash<Key>,
  typename KeyEqual = std::equal_to<Key>
>
using unordered_set = std::unordered_set<Key, Hash, KeyEqual, gc_allocator<Key>>;

/** Map keyed by collected strings, searchable with string views */
template <typename T>
using string_map = unordered_map<string, T, string_hash, std::equal_to<>>;

using string_set = unordered_set<string, string_hash, std::equal_to<>>;

} // namespace alm::stl
