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
#ifndef INCLUDED_tsse_api_CResultJsonWriter_h
#define INCLUDED_tsse_api_CResultJsonWriter_h

#include <core/CBoostJsonParser.h>
#include <core/CoreTypes.h>

#include <analytics/AnalyticsTypes.h>
#include <analytics/CCooccurrenceScorer.h>
#include <analytics/CCorrelationMatrix.h>
#include <analytics/CEventMatcher.h>
#include <analytics/CMatrixProfile.h>
#include <analytics/CUnifiedRanker.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace tsse {
namespace api {
struct SNoopParams;

//! \brief Encodes the result of each job type as a JSON document.
//!
//! DESCRIPTION:\n
//! The documents use the field names the dashboard reads.  Times are ISO
//! 8601 UTC strings, lags and intervals are seconds and missing optional
//! values are written as null.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Non-finite numbers have no JSON representation.  They are logged and
//! written as null, which readers already handle for missing values, rather
//! than as a number which could be mistaken for a real result.
//!
//! Encoding never throws: a failure is logged and reported by the return
//! value so the engine can fail the job with a specific error code.
class CResultJsonWriter {
public:
    //! Write \p result to \p document.  Returns false on failure.
    bool write(const analytics::CCorrelationMatrix::SResult& result, json::value& document) const;
    bool write(const analytics::CMatrixProfile::SResult& result, json::value& document) const;
    bool write(const analytics::CEventMatcher::SResult& result, json::value& document) const;
    bool write(const analytics::CCooccurrenceScorer::SResult& result, json::value& document) const;
    bool write(const analytics::CUnifiedRanker::SResult& result, json::value& document) const;
    bool write(const SNoopParams& params, json::value& document) const;

private:
    using TStrSizeMap = std::map<std::string, std::size_t>;

private:
    //! Encode with \p f catching anything it throws.
    template<typename F>
    bool encode(const std::string& type, F f, json::value& document) const;

    json::object correlationMatrix(const analytics::CCorrelationMatrix::SResult& result) const;
    json::object matrixProfile(const analytics::CMatrixProfile::SResult& result) const;
    json::object eventMatch(const analytics::CEventMatcher::SResult& result) const;
    json::object cooccurrence(const analytics::CCooccurrenceScorer::SResult& result) const;
    json::object relatedSensorsUnified(const analytics::CUnifiedRanker::SResult& result) const;

    json::object lagScore(const analytics::CEventMatcher::SLagScore& score) const;
    json::object episode(const analytics::SEpisode& episode) const;
    json::object monitoring(const analytics::CEventMatcher::SMonitoring& monitoring) const;
    json::object detector(const analytics::CEventDetector::SOptions& options) const;
    json::object filters(const analytics::SCandidateFilters& filters) const;
    json::object matrixProfileWindow(const analytics::CMatrixProfile::SWindow& window) const;
    json::array skipped(const analytics::TSkippedVec& skipped) const;
    json::object timings(const analytics::TPhaseTimingVec& timings) const;
    json::object counts(const TStrSizeMap& counts) const;

    void addDoubleFieldToObj(const std::string& fieldName, double value, json::object& obj) const;
    void addOptionalDoubleFieldToObj(const std::string& fieldName,
                                     const analytics::TOptionalDouble& value,
                                     json::object& obj) const;
    template<typename T>
    void addOptionalFieldToObj(const std::string& fieldName,
                               const std::optional<T>& value,
                               json::object& obj) const;
    void addTimeFieldToObj(const std::string& fieldName, core_t::TTime value, json::object& obj) const;
    void addStringArrayFieldToObj(const std::string& fieldName,
                                  const analytics::TStrVec& values,
                                  json::object& obj) const;
    void addDoubleArrayFieldToObj(const std::string& fieldName,
                                  const analytics::TDoubleVec& values,
                                  json::object& obj) const;
    void addTimeArrayFieldToObj(const std::string& fieldName,
                                const analytics::TTimeVec& values,
                                json::object& obj) const;
};
}
}

#endif // INCLUDED_tsse_api_CResultJsonWriter_h
