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
#include <analytics/CAnalysisContext.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>

namespace tsse {
namespace analytics {

CAnalysisContext::CAnalysisContext()
    : m_Progress{[](const std::string&, std::size_t, std::size_t, const std::string&) {}},
      m_PhaseTiming{[](const std::string&, std::uint64_t) {}} {
}

CAnalysisContext::CAnalysisContext(core::CCancellationToken cancellation,
                                   TProgressFunc progress,
                                   TPhaseTimingFunc phaseTiming)
    : m_Cancellation{std::move(cancellation)}, m_Progress{std::move(progress)},
      m_PhaseTiming{std::move(phaseTiming)} {
}

void CAnalysisContext::progress(const std::string& phase,
                                std::size_t completed,
                                std::size_t total,
                                const std::string& message) const {
    if (m_Progress) {
        m_Progress(phase, completed, total, message);
    }
}

void CAnalysisContext::phaseTiming(const std::string& phase, std::uint64_t milliseconds) const {
    if (m_PhaseTiming) {
        m_PhaseTiming(phase, milliseconds);
    }
}

core::CLoopProgress CAnalysisContext::loopProgress(const std::string& phase,
                                                   std::size_t total,
                                                   const std::string& message) const {
    this->progress(phase, 0, total, message);
    // The monitor reports increments.
    auto fraction = std::make_shared<double>(0.0);
    return core::CLoopProgress{total, [this, phase, total, message, fraction](double increment) {
                                   *fraction += increment;
                                   auto completed = static_cast<std::size_t>(
                                       std::floor(*fraction * static_cast<double>(total) + 0.5));
                                   this->progress(phase, std::min(completed, total), total, message);
                               }};
}

const core::CCancellationToken& CAnalysisContext::cancellation() const {
    return m_Cancellation;
}

void CAnalysisContext::throwIfCanceled() const {
    m_Cancellation.throwIfCanceled();
}

void CAnalysisContext::throwIfCanceled(std::size_t iteration, std::size_t every) const {
    m_Cancellation.throwIfCanceled(iteration, every);
}
}
}
