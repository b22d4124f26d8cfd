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
#include <core/CLoopProgress.h>

#include <algorithm>
#include <limits>

namespace tsse {
namespace core {

CLoopProgress::CLoopProgress()
    : m_Range{std::numeric_limits<std::size_t>::max()}, m_Steps{1},
      m_StepProgress{1.0}, m_RecordProgress{noop} {
}

CLoopProgress::CLoopProgress(std::size_t range,
                             const TProgressCallback& recordProgress,
                             double scale,
                             std::size_t steps)
    : m_Range{std::max(range, std::size_t{1})}, m_Steps{std::min(m_Range, steps)},
      m_StepProgress{scale / static_cast<double>(m_Steps)}, m_RecordProgress{recordProgress} {
}

void CLoopProgress::progressCallback(const TProgressCallback& recordProgress) {
    m_RecordProgress = recordProgress;
}

void CLoopProgress::increment(std::size_t i) {
    m_Pos += i;
    if (m_Steps * m_Pos + 1 > (m_LastProgress + 1) * m_Range) {
        // If i is large we may have jumped several steps.
        std::size_t stride{m_Steps * std::min(m_Pos, m_Range) / m_Range - m_LastProgress};
        if (stride > 0) {
            m_RecordProgress(static_cast<double>(stride) * m_StepProgress);
            m_LastProgress += stride;
        }
    }
}

void CLoopProgress::noop(double) {
}
}
}
