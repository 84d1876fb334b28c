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

#include <chrono>
#include <string>
#include <string_view>

namespace alm {

/**
 * Scoped wall-clock timer
 *
 * Starts on construction and stops on destruction. Durations accumulate in
 * process-wide statistics keyed by name, which report_global_stats() prints
 * at info level. The pipeline wraps every pass in one of these.
 *
 * ```
 * {
 *   execution_timer timer {"effect-lifting"};
 *   // ...
 * }
 * ```
 */
class execution_timer {
  public:
  explicit execution_timer(std::string_view name, bool auto_start = true);

  ~execution_timer();

  execution_timer(const execution_timer&) = delete;
  execution_timer& operator = (const execution_timer&) = delete;

  static void
  report_global_stats();

  void
  start();

  void
  stop();

  template <typename Duration>
  Duration
  elapsed() const
  { return std::chrono::duration_cast<Duration>(m_total_duration); }

  private:
  std::string m_name;
  bool m_running;
  std::chrono::time_point<std::chrono::steady_clock> m_start_time;
  std::chrono::nanoseconds m_total_duration;
}; // class alm::execution_timer

} // namespace alm
