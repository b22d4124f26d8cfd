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
#ifndef INCLUDED_tsse_api_CJobExecutor_h
#define INCLUDED_tsse_api_CJobExecutor_h

#include <core/CBoostJsonParser.h>

#include <analytics/CBucketReader.h>

#include <api/CJobParams.h>
#include <api/CResultJsonWriter.h>

#include <string>

namespace tsse {
namespace analytics {
class CAnalysisContext;
class CSampleStore;
class CSensorRegistry;
}
namespace api {

//! \brief Runs one analysis job to completion on the calling thread.
//!
//! DESCRIPTION:\n
//! Dispatches the typed parameters to the matching analysis and encodes
//! its result as JSON.  Every job reads its own buckets and owns all the
//! data it computes with, so one executor is shared by all jobs.
//!
//! Failures are reported by throwing CJobFailure with a stable code and
//! cancellation by letting core::CCanceledException propagate.
class CJobExecutor {
public:
    CJobExecutor(const analytics::CSensorRegistry& registry,
                 const analytics::CSampleStore& store);

    //! Check the parameters against the sensor registry.  This catches
    //! requests which can never succeed before a job is created for them.
    bool validate(const CJobParams& params, std::string& error) const;

    //! Run the job described by \p params.
    json::value execute(const CJobParams& params,
                        const analytics::CAnalysisContext& context) const;

private:
    json::value run(const analytics::CCorrelationMatrix::SParams& params,
                    const analytics::CAnalysisContext& context) const;
    json::value run(const analytics::CMatrixProfile::SParams& params,
                    const analytics::CAnalysisContext& context) const;
    json::value run(const analytics::CEventMatcher::SParams& params,
                    const analytics::CAnalysisContext& context) const;
    json::value run(const analytics::CCooccurrenceScorer::SParams& params,
                    const analytics::CAnalysisContext& context) const;
    json::value run(const analytics::CUnifiedRanker::SParams& params,
                    const analytics::CAnalysisContext& context) const;
    json::value run(const SNoopParams& params,
                    const analytics::CAnalysisContext& context) const;

    template<typename RESULT>
    json::value encode(const RESULT& result) const;

private:
    const analytics::CSensorRegistry& m_Registry;
    analytics::CBucketReader m_Reader;
    CResultJsonWriter m_Writer;
};
}
}

#endif // INCLUDED_tsse_api_CJobExecutor_h
