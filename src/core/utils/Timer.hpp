//  Copyright (c) 2021, SBEL GPU Development Team
//  Copyright (c) 2021, University of Wisconsin - Madison
//
//	SPDX-License-Identifier: BSD-3-Clause

#ifndef DDAP_TIMER_HPP
#define DDAP_TIMER_HPP

#include <chrono>

namespace ddap {

/// Accumulating wall-clock timer used to report how long placement and discretization passes take.
template <class seconds_type = double>
class Timer {
  private:
    std::chrono::steady_clock::time_point m_start;
    std::chrono::duration<seconds_type> m_total;
    bool m_running = false;

  public:
    Timer() { m_total = std::chrono::duration<seconds_type>(0); }

    /// Start (or resume) the timer
    void start() {
        m_start = std::chrono::steady_clock::now();
        m_running = true;
    }

    /// Stop the timer and add the elapsed interval to the total
    void stop() {
        if (!m_running)
            return;
        m_total += std::chrono::steady_clock::now() - m_start;
        m_running = false;
    }

    void reset() {
        m_total = std::chrono::duration<seconds_type>(0);
        m_running = false;
    }

    /// Accumulated time in [ms]. Use start()..stop() before calling this.
    unsigned long long GetTimeMilliseconds() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(m_total).count();
    }

    /// Accumulated time in [s]. Use start()..stop() before calling this.
    seconds_type GetTimeSeconds() const { return m_total.count(); }

};

}  // namespace ddap

#endif
