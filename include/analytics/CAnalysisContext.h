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
#ifndef INCLUDED_tsse_analytics_CAnalysisContext_h
#define INCLUDED_tsse_analytics_CAnalysisContext_h

#include <core/CCancellationToken.h>
#include <core/CLoopProgress.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace tsse {
namespace analytics {

//! \brief The hooks an analysis uses to talk to the job running it.
//!
//! DESCRIPTION:\n
//! Bundles the cooperative cancellation token with callbacks which report
//! phase progress and phase timings.  A default constructed context is
//! never canceled and discards all reports, which is what tests and
//! direct callers want.
class CAnalysisContext {
public:
    using TProgressFunc = std::function<void(const std::string& phase,
                                             std::size_t completed,
                                             std::size_t total,
                                             const std::string& message)>;
    using TPhaseTimingFunc =
        std::function<void(const std::string& phase, std::uint64_t milliseconds)>;

public:
    CAnalysisContext();
    CAnalysisContext(core::CCancellationToken cancellation,
                     TProgressFunc progress,
                     TPhaseTimingFunc phaseTiming);

    //! Report progress through \p phase.
    void progress(const std::string& phase,
                  std::size_t completed,
                  std::size_t total,
                  const std::string& message = std::string{}) const;

    //! Report the time spent in \p phase.
    void phaseTiming(const std::string& phase, std::uint64_t milliseconds) const;

    //! Get a loop progress monitor for a loop of \p total iterations in
    //! \p phase.
    core::CLoopProgress loopProgress(const std::string& phase,
                                     std::size_t total,
                                     const std::string& message = std::string{}) const;

    const core::CCancellationToken& cancellation() const;

    //! \see core::CCancellationToken::throwIfCanceled.
    void throwIfCanceled() const;
    void throwIfCanceled(std::size_t iteration, std::size_t every) const;

private:
    core::CCancellationToken m_Cancellation;
    TProgressFunc m_Progress;
    TPhaseTimingFunc m_PhaseTiming;
};
}
}

#endif // INCLUDED_tsse_analytics_CAnalysisContext_h
