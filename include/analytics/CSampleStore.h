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
#ifndef INCLUDED_tsse_analytics_CSampleStore_h
#define INCLUDED_tsse_analytics_CSampleStore_h

#include <core/CoreTypes.h>

#include <analytics/AnalyticsTypes.h>

#include <map>
#include <mutex>
#include <string>

namespace tsse {
namespace analytics {

//! \brief Read access to raw samples in the time-series store.
//!
//! DESCRIPTION:\n
//! The analytics only ever read history through this interface.  The write
//! path and storage format belong to the store.
class CSampleStore {
public:
    virtual ~CSampleStore() = default;

    //! Fill \p result with the samples of \p sensorId with time in
    //! [\p start, \p end) sorted by time.  Returns false if the store
    //! has no history for the sensor at all.
    virtual bool readSamples(const std::string& sensorId,
                             core_t::TTime start,
                             core_t::TTime end,
                             TSampleVec& result) const = 0;
};

//! \brief A store which holds all samples in memory.
class CInMemorySampleStore : public CSampleStore {
public:
    //! Add one sample.
    void addSample(const std::string& sensorId, const SSample& sample);

    //! Add many samples in any order.
    void addSamples(const std::string& sensorId, const TSampleVec& samples);

    bool readSamples(const std::string& sensorId,
                     core_t::TTime start,
                     core_t::TTime end,
                     TSampleVec& result) const override;

    //! The number of samples held for \p sensorId.
    std::size_t numberSamples(const std::string& sensorId) const;

private:
    using TStrSampleVecMap = std::map<std::string, TSampleVec>;

private:
    void sortIfNecessary(const std::string& sensorId) const;

private:
    mutable std::mutex m_Mutex;
    mutable TStrSampleVecMap m_Samples;
    mutable std::map<std::string, bool> m_Sorted;
};
}
}

#endif // INCLUDED_tsse_analytics_CSampleStore_h
