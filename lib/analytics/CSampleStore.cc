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
#include <analytics/CSampleStore.h>

#include <algorithm>

namespace tsse {
namespace analytics {
namespace {
bool earlier(const SSample& lhs, const SSample& rhs) {
    return lhs.s_Time < rhs.s_Time;
}
}

void CInMemorySampleStore::addSample(const std::string& sensorId, const SSample& sample) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    m_Samples[sensorId].push_back(sample);
    m_Sorted[sensorId] = false;
}

void CInMemorySampleStore::addSamples(const std::string& sensorId, const TSampleVec& samples) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    auto& existing = m_Samples[sensorId];
    existing.insert(existing.end(), samples.begin(), samples.end());
    m_Sorted[sensorId] = false;
}

bool CInMemorySampleStore::readSamples(const std::string& sensorId,
                                       core_t::TTime start,
                                       core_t::TTime end,
                                       TSampleVec& result) const {
    result.clear();
    std::lock_guard<std::mutex> lock{m_Mutex};
    auto i = m_Samples.find(sensorId);
    if (i == m_Samples.end()) {
        return false;
    }
    this->sortIfNecessary(sensorId);
    const TSampleVec& samples{i->second};
    SSample key;
    key.s_Time = start;
    auto first = std::lower_bound(samples.begin(), samples.end(), key, earlier);
    key.s_Time = end;
    auto last = std::lower_bound(first, samples.end(), key, earlier);
    result.assign(first, last);
    return true;
}

std::size_t CInMemorySampleStore::numberSamples(const std::string& sensorId) const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    auto i = m_Samples.find(sensorId);
    return i == m_Samples.end() ? 0 : i->second.size();
}

void CInMemorySampleStore::sortIfNecessary(const std::string& sensorId) const {
    bool& sorted = m_Sorted[sensorId];
    if (sorted == false) {
        auto& samples = m_Samples[sensorId];
        std::stable_sort(samples.begin(), samples.end(), earlier);
        sorted = true;
    }
}
}
}
