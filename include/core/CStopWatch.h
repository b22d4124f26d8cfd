/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License
 * 2.0 and the following additional limitation. Functionality enabled by the
 * files subject to the Elastic License 2.0 may only be used in production when
 * invoked by an Elasticsearch process with a license key installed that permits
 * use of machine learning features. You may not use this file except in
 * compliance with the Elastic License 2.0 and the foregoing additional
 * limitation.
 */
#ifndef INCLUDED_tsse_core_CStopWatch_h
#define INCLUDED_tsse_core_CStopWatch_h

#include <chrono>
#include <cstdint>

namespace tsse {
namespace core {

//! \brief
//! Can be used for timing within a program
//!
//! DESCRIPTION:\n
//! Used to time the phases of an analysis job and to enforce compute
//! budgets.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The interface mirrors the stop watch functionality you would expect
//! on a cheap digital watch.
//!
//! Uses the steady clock, so readings never go backwards if the user
//! sets the system clock.
//!
class CStopWatch {
public:
    //! Construct a stop watch, optionally starting it immediately
    explicit CStopWatch(bool startRunning = false);

    //! Start the stop watch
    void start();

    //! Stop the stop watch and retrieve the accumulated reading
    std::uint64_t stop();

    //! Retrieve the accumulated reading from the stop watch without
    //! stopping it.
    std::uint64_t lap() const;

    //! Is the stop watch running?
    bool isRunning() const;

    //! Reset the stop watch, optionally starting it immediately
    void reset(bool startRunning = false);

private:
    using TClock = std::chrono::steady_clock;

private:
    std::uint64_t elapsedSinceStart() const;

private:
    //! Is the stop watch currently running?
    bool m_IsRunning;

    //! When the stop watch was last started
    TClock::time_point m_Start;

    //! Milliseconds accumulated over previous runs since the last reset
    std::uint64_t m_AccumulatedTime;
};
}
}

#endif // INCLUDED_tsse_core_CStopWatch_h
