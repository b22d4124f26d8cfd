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
#include <core/CCancellationToken.h>
#include <core/CLogger.h>

#include <analytics/CAnalysisContext.h>
#include <analytics/CBucketReader.h>
#include <analytics/CSampleStore.h>
#include <analytics/CSensorRegistry.h>
#include <analytics/CUnifiedRanker.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(CUnifiedRankerTest)

using namespace tsse;

namespace {
using TDoubleVec = std::vector<double>;
using TSizeVec = std::vector<std::size_t>;
using TRanker = analytics::CUnifiedRanker;
using TMatcher = analytics::CEventMatcher;
using TScorer = analytics::CCooccurrenceScorer;

const core_t::TTime START{28333333 * 60};
const core_t::TTime INTERVAL{60};
const std::size_t N{1200};

core_t::TTime bucketTime(std::size_t i) {
    return START + static_cast<core_t::TTime>(i) * INTERVAL;
}

TDoubleVec pulses(test::CRandomNumbers& rng, const TSizeVec& at, double height) {
    TDoubleVec result;
    rng.generateNormalSamples(20.0, 0.01, N, result);
    for (auto i : at) {
        result[i] += height;
        result[i + 1] += 0.5 * height;
    }
    return result;
}

analytics::SSensorInfo::SDerivedSpec derivedFrom(const std::string& input, double coefficient) {
    analytics::SSensorInfo::SDerivedSpec result;
    result.s_Inputs.push_back({input, coefficient, 0});
    return result;
}

//! Fails every read while it is switched on.
class CFailingSampleStore : public analytics::CInMemorySampleStore {
public:
    void failReads(bool fail) { m_Fail.store(fail); }

    bool readSamples(const std::string& sensorId,
                     core_t::TTime start,
                     core_t::TTime end,
                     analytics::TSampleVec& result) const override {
        if (m_Fail.load()) {
            throw std::runtime_error{"store unavailable"};
        }
        return analytics::CInMemorySampleStore::readSamples(sensorId, start, end, result);
    }

private:
    std::atomic<bool> m_Fail{false};
};

class CFixture {
public:
    CFixture() : m_Reader{m_Registry, m_Store} {}

    void add(const std::string& id, const TDoubleVec& values) {
        m_Registry.addSensor(info(id));
        for (std::size_t i = 0; i < values.size(); ++i) {
            m_Store.addSample(id, {bucketTime(i) + 5, values[i]});
        }
    }

    void addDerived(const std::string& id, const analytics::SSensorInfo::SDerivedSpec& spec) {
        analytics::SSensorInfo sensor{info(id)};
        sensor.s_Derived = spec;
        m_Registry.addSensor(sensor);
    }

    void addForecast(const std::string& id) {
        analytics::SSensorInfo sensor{info(id)};
        sensor.s_Source = analytics::SSensorInfo::E_ForecastPoints;
        m_Registry.addSensor(sensor);
    }

    void addStandardSensors() {
        test::CRandomNumbers rng;
        this->add("focus", pulses(rng, {100, 499, 902}, 10.0));
        this->add("follows", pulses(rng, {101, 500, 903}, 10.0));
        this->add("inverse", pulses(rng, {101, 500, 903}, -10.0));
        this->add("unrelated", pulses(rng, {300, 700}, 10.0));
    }

    void addNoise(std::size_t n) {
        test::CRandomNumbers rng;
        for (std::size_t i = 0; i < n; ++i) {
            std::ostringstream id;
            id << "n" << std::setw(2) << std::setfill('0') << i;
            TDoubleVec values;
            rng.generateNormalSamples(10.0, 1.0, N, values);
            this->add(id.str(), values);
        }
    }

    TRanker::SParams params() const {
        TRanker::SParams result;
        result.s_FocusSensorId = "focus";
        result.s_Start = START;
        result.s_End = bucketTime(N);
        result.s_Interval = INTERVAL;
        result.s_JobKey = "job";
        result.s_ZThreshold = 6.0;
        result.s_IncludeDeltaCorrelation = false;
        return result;
    }

    TRanker ranker() const { return TRanker{m_Registry, m_Reader}; }

    //! A context which fails all reads from the start of the ranker phase
    //! \p from until the start of the ranker phase \p until.
    analytics::CAnalysisContext failReadsBetween(const std::string& from, const std::string& until) {
        return analytics::CAnalysisContext{
            core::CCancellationToken{},
            [this, from, until](const std::string& phase, std::size_t, std::size_t, const std::string&) {
                if (phase == from) {
                    m_Store.failReads(true);
                } else if (phase == until) {
                    m_Store.failReads(false);
                }
            },
            nullptr};
    }

private:
    static analytics::SSensorInfo info(const std::string& id) {
        analytics::SSensorInfo result;
        result.s_Id = id;
        result.s_Type = "temperature";
        result.s_Unit = "C";
        result.s_NodeId = "node";
        return result;
    }

private:
    analytics::CSensorRegistry m_Registry;
    CFailingSampleStore m_Store;
    analytics::CBucketReader m_Reader;
};

const TRanker::SCandidate* find(const TRanker::TCandidateVec& candidates, const std::string& id) {
    auto i = std::find_if(candidates.begin(), candidates.end(),
                          [&id](const TRanker::SCandidate& candidate) {
                              return candidate.s_SensorId == id;
                          });
    return i != candidates.end() ? &(*i) : nullptr;
}

std::size_t countSkipped(const TRanker::SResult& result, analytics_t::ESkipReason reason) {
    return static_cast<std::size_t>(std::count_if(
        result.s_Skipped.begin(), result.s_Skipped.end(),
        [reason](const analytics::SSkipped& skipped) { return skipped.s_Reason == reason; }));
}

TMatcher::SCandidate matched(const std::string& id,
                             analytics::TOptionalDouble score,
                             std::size_t overlap,
                             std::size_t numberCandidate,
                             core_t::TTime lag) {
    TMatcher::SCandidate result;
    result.s_SensorId = id;
    result.s_Score = score;
    result.s_Overlap = overlap;
    result.s_NumberFocus = 10;
    result.s_NumberCandidate = numberCandidate;
    TMatcher::SLagScore best;
    best.s_LagSeconds = lag;
    best.s_Score = score;
    best.s_Valid = true;
    result.s_BestLag = best;
    return result;
}

TScorer::SScoredBucket bucket(core_t::TTime time,
                              const std::vector<std::pair<std::string, double>>& participants) {
    TScorer::SScoredBucket result;
    result.s_Time = time;
    for (const auto& participant : participants) {
        TScorer::SParticipant sensor;
        sensor.s_SensorId = participant.first;
        sensor.s_Time = time;
        sensor.s_Z = participant.second;
        result.s_Sensors.push_back(sensor);
    }
    result.s_GroupSize = participants.size();
    result.s_Score = 1.0;
    return result;
}

//! Event evidence for a, b and c and co-occurrence with focus f:
//!   a: F1 0.8 with two multi-point episodes, shares two buckets with f.
//!   b: F1 0.4 at a one day lag, four times as many events as f.
//!   c: no event match, shares one bucket with f.
void mergeInputs(TMatcher::SResult& events, TScorer::SResult& cooccurrence) {
    events.s_Candidates.push_back(matched("a", 0.8, 4, 10, 60));
    analytics::SEpisode episode;
    episode.s_NumPoints = 2;
    events.s_Candidates.back().s_Episodes = {episode, episode};
    events.s_Candidates.push_back(matched("b", 0.4, 2, 40, 86400));
    events.s_Candidates.push_back(matched("c", std::nullopt, 0, 0, 0));

    cooccurrence.s_Buckets.push_back(bucket(1000, {{"b", 20.0}, {"a", 5.0}, {"f", 4.0}}));
    cooccurrence.s_Buckets.push_back(bucket(2000, {{"a", 3.0}, {"f", 2.0}}));
    cooccurrence.s_Buckets.push_back(bucket(3000, {{"c", 6.0}, {"f", 3.0}}));
    cooccurrence.s_Buckets.push_back(bucket(4000, {{"a", 9.0}, {"x", 9.0}}));
    cooccurrence.s_SensorStats["f"].s_MeanAbsZ = 3.0;
    cooccurrence.s_SensorStats["a"].s_MeanAbsZ = 4.0;
    cooccurrence.s_SensorStats["b"].s_MeanAbsZ = 15.0;
    cooccurrence.s_SensorStats["c"].s_MeanAbsZ = 6.0;
}
}

BOOST_AUTO_TEST_CASE(testMergeAvgProduct) {
    TMatcher::SResult events;
    TScorer::SResult cooccurrence;
    mergeInputs(events, cooccurrence);

    TRanker::SMergeOptions options;
    options.s_FocusSensorId = "f";
    auto merged = TRanker::merge(events, cooccurrence, options);

    // Shared bucket products: a (4*5 + 2*3) / 2 = 13, b 4*15 = 60 halved by
    // the prevalence penalty and c 3*6 = 18.
    BOOST_REQUIRE_EQUAL(3, merged.s_CooccurrenceSensors);
    BOOST_REQUIRE_EQUAL(2, merged.s_Candidates.size());

    const auto& a = merged.s_Candidates[0];
    BOOST_REQUIRE_EQUAL("a", a.s_SensorId);
    BOOST_REQUIRE_EQUAL(1, a.s_Rank);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.6 + 0.4 * 13.0 / 30.0 + TRanker::MULTI_EPISODE_BONUS,
                                 a.s_BlendedScore, 1e-9);
    BOOST_REQUIRE_EQUAL(analytics_t::E_High, a.s_Confidence);
    BOOST_TEST_REQUIRE(a.s_Evidence.s_MultiEpisodeBonus);
    BOOST_REQUIRE_EQUAL(2, *a.s_Evidence.s_CooccurrenceCount);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(26.0, *a.s_Evidence.s_CooccurrenceScore, 1e-9);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(13.0, *a.s_Evidence.s_CooccurrenceAvg, 1e-9);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(13.0 / 12.0, *a.s_Evidence.s_CooccurrenceSurprise, 1e-9);
    BOOST_REQUIRE_EQUAL(2, a.s_TopBucketTimes.size());
    BOOST_REQUIRE_EQUAL(2000, a.s_TopBucketTimes[0]);
    BOOST_REQUIRE_EQUAL(1000, a.s_TopBucketTimes[1]);
    BOOST_REQUIRE_EQUAL(60, *a.s_Evidence.s_BestLagSeconds);
    BOOST_REQUIRE_EQUAL(3, a.s_Evidence.s_Summary.size());
    BOOST_REQUIRE_EQUAL("Event match (F1) 0.80 \xE2\x80\xA2 matched: 4", a.s_Evidence.s_Summary[0]);
    BOOST_REQUIRE_EQUAL("Best lag 60s", a.s_Evidence.s_Summary[2]);

    const auto& b = merged.s_Candidates[1];
    BOOST_REQUIRE_EQUAL("b", b.s_SensorId);
    BOOST_REQUIRE_EQUAL(2, b.s_Rank);
    BOOST_TEST_REQUIRE(b.s_Evidence.s_DiurnalLag);
    BOOST_TEST_REQUIRE(b.s_Evidence.s_MultiEpisodeBonus == false);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.6 * 0.4 * TRanker::DIURNAL_LAG_PENALTY / 0.8 + 0.4,
                                 b.s_BlendedScore, 1e-9);
    BOOST_REQUIRE_EQUAL(analytics_t::E_Medium, b.s_Confidence);
    BOOST_REQUIRE_EQUAL("Lag near a whole number of days", b.s_Evidence.s_Summary.back());

    // c is low confidence.
    options.s_IncludeLow = true;
    merged = TRanker::merge(events, cooccurrence, options);
    BOOST_REQUIRE_EQUAL(3, merged.s_Candidates.size());
    BOOST_REQUIRE_EQUAL("c", merged.s_Candidates[2].s_SensorId);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.4 * 18.0 / 30.0, merged.s_Candidates[2].s_BlendedScore, 1e-9);
    BOOST_REQUIRE_EQUAL(analytics_t::E_Low, merged.s_Candidates[2].s_Confidence);

    options.s_MaxResults = 1;
    merged = TRanker::merge(events, cooccurrence, options);
    BOOST_REQUIRE_EQUAL(1, merged.s_Candidates.size());
    BOOST_REQUIRE_EQUAL(2, merged.s_TruncatedSensorIds.size());
    BOOST_REQUIRE_EQUAL("b", merged.s_TruncatedSensorIds[0]);
}

BOOST_AUTO_TEST_CASE(testMergeSurpriseAndDerived) {
    TMatcher::SResult events;
    TScorer::SResult cooccurrence;
    mergeInputs(events, cooccurrence);

    TRanker::SMergeOptions options;
    options.s_FocusSensorId = "f";
    options.s_Metric = TRanker::E_Surprise;
    auto merged = TRanker::merge(events, cooccurrence, options);

    // Surprise ratios are a 13/12, b 60/45 halved and c 18/18.
    BOOST_REQUIRE_EQUAL(3, merged.s_Candidates.size());
    BOOST_REQUIRE_EQUAL("a", merged.s_Candidates[0].s_SensorId);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, merged.s_Candidates[0].s_BlendedScore, 1e-9);
    BOOST_REQUIRE_EQUAL("c", merged.s_Candidates[1].s_SensorId);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.4 * 12.0 / 13.0, merged.s_Candidates[1].s_BlendedScore, 1e-9);
    BOOST_REQUIRE_EQUAL(analytics_t::E_Medium, merged.s_Candidates[1].s_Confidence);
    BOOST_REQUIRE_EQUAL("b", merged.s_Candidates[2].s_SensorId);

    options.s_DerivedPaths["b"] = {"b", "f"};
    merged = TRanker::merge(events, cooccurrence, options);
    BOOST_REQUIRE_EQUAL(2, merged.s_Candidates.size());
    BOOST_REQUIRE_EQUAL(1, merged.s_ExcludedDerived.size());
    BOOST_REQUIRE_EQUAL("b", merged.s_ExcludedDerived[0].s_SensorId);
    BOOST_TEST_REQUIRE(merged.s_ExcludedDerived[0].s_DerivedFromFocus);

    options.s_ExcludeDerived = false;
    merged = TRanker::merge(events, cooccurrence, options);
    BOOST_REQUIRE_EQUAL(3, merged.s_Candidates.size());
    const auto* b = find(merged.s_Candidates, "b");
    BOOST_TEST_REQUIRE(b != nullptr);
    BOOST_TEST_REQUIRE(b->s_DerivedFromFocus);
    BOOST_REQUIRE_EQUAL(2, b->s_DerivedDependencyPath.size());
}

BOOST_AUTO_TEST_CASE(testCandidateLimit) {
    TRanker::SParams params;
    BOOST_REQUIRE_EQUAL(200, TRanker::candidateLimit(params, 0, 1000));
    params.s_QuickSuggest = true;
    BOOST_REQUIRE_EQUAL(80, TRanker::candidateLimit(params, 0, 1000));
    params.s_QuickSuggest = false;
    params.s_CandidateLimit = 500;
    BOOST_REQUIRE_EQUAL(TRanker::SIMPLE_CANDIDATE_LIMIT, TRanker::candidateLimit(params, 0, 1000));
    params.s_Mode = TRanker::E_Advanced;
    BOOST_REQUIRE_EQUAL(500, TRanker::candidateLimit(params, 0, 1000));
    params.s_CandidateLimit = 5000;
    BOOST_REQUIRE_EQUAL(TRanker::MAX_CANDIDATE_LIMIT, TRanker::candidateLimit(params, 0, 1000));
    params.s_CandidateLimit = 3;
    BOOST_REQUIRE_EQUAL(TRanker::MIN_CANDIDATE_LIMIT, TRanker::candidateLimit(params, 0, 1000));
    params.s_CandidateLimit = 20;
    BOOST_REQUIRE_EQUAL(40, TRanker::candidateLimit(params, 40, 1000));
    params.s_EvaluateAllEligible = true;
    BOOST_REQUIRE_EQUAL(700, TRanker::candidateLimit(params, 0, 700));
    BOOST_REQUIRE_EQUAL(5, TRanker::candidateLimit(params, 5, 2));
}

BOOST_AUTO_TEST_CASE(testNormaliseWeights) {
    auto weights = TRanker::normaliseWeights(std::nullopt, false);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.6, weights.s_Events, 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.4, weights.s_Cooccurrence, 1e-12);
    BOOST_TEST_REQUIRE(weights.s_DeltaCorrelation.has_value() == false);

    weights = TRanker::normaliseWeights(std::nullopt, true);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.2, *weights.s_DeltaCorrelation, 1e-12);

    TRanker::SWeights requested;
    requested.s_Events = 1.0;
    requested.s_Cooccurrence = 1.0;
    weights = TRanker::normaliseWeights(requested, false);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.5, weights.s_Events, 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.5, weights.s_Cooccurrence, 1e-12);

    requested.s_DeltaCorrelation = 2.0;
    weights = TRanker::normaliseWeights(requested, true);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.25, weights.s_Events, 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.5, *weights.s_DeltaCorrelation, 1e-12);

    // Invalid weights fall back to their defaults.
    requested.s_Events = std::numeric_limits<double>::quiet_NaN();
    weights = TRanker::normaliseWeights(requested, false);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.6 / 1.6, weights.s_Events, 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0 / 1.6, weights.s_Cooccurrence, 1e-12);

    requested.s_Events = 0.0;
    requested.s_Cooccurrence = 0.0;
    requested.s_DeltaCorrelation = 0.0;
    weights = TRanker::normaliseWeights(requested, true);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.6, weights.s_Events, 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.2, *weights.s_DeltaCorrelation, 1e-12);
}

BOOST_AUTO_TEST_CASE(testScoringHelpers) {
    BOOST_REQUIRE_EQUAL(analytics_t::E_High, TRanker::confidence(0.8, 2, 0));
    BOOST_REQUIRE_EQUAL(analytics_t::E_High, TRanker::confidence(0.8, 0, 2));
    BOOST_REQUIRE_EQUAL(analytics_t::E_Medium, TRanker::confidence(0.8, 1, 1));
    BOOST_REQUIRE_EQUAL(analytics_t::E_Low, TRanker::confidence(0.4, 0, 0));
    BOOST_REQUIRE_EQUAL(analytics_t::E_Low, TRanker::confidence(0.3, 5, 5));

    BOOST_REQUIRE_EQUAL(1.0, TRanker::prevalencePenalty(0, 5));
    BOOST_REQUIRE_EQUAL(1.0, TRanker::prevalencePenalty(10, 5));
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.5, TRanker::prevalencePenalty(10, 40), 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.25, TRanker::prevalencePenalty(1, 100), 1e-12);

    BOOST_REQUIRE_CLOSE_ABSOLUTE(13.0 / 12.0, *TRanker::surpriseRatio(13.0, 3.0, 4.0), 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(10.0, *TRanker::surpriseRatio(1000.0, 1.0, 1.0), 1e-12);
    BOOST_TEST_REQUIRE(TRanker::surpriseRatio(1.0, 0.0, 1.0).has_value() == false);

    BOOST_TEST_REQUIRE(TRanker::isDiurnalLag(0) == false);
    BOOST_TEST_REQUIRE(TRanker::isDiurnalLag(3600) == false);
    BOOST_TEST_REQUIRE(TRanker::isDiurnalLag(43200) == false);
    BOOST_TEST_REQUIRE(TRanker::isDiurnalLag(86400));
    BOOST_TEST_REQUIRE(TRanker::isDiurnalLag(-86400 - 1800));
    BOOST_TEST_REQUIRE(TRanker::isDiurnalLag(86400 + 1801) == false);
    BOOST_TEST_REQUIRE(TRanker::isDiurnalLag(2 * 86400 + 100));

    analytics::TStrVec lhs{"a", "b", "c"};
    analytics::TStrVec rhs{"c", "a", "x"};
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.5, TRanker::overlapAtK(lhs, rhs, 2), 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(2.0 / 3.0, TRanker::overlapAtK(lhs, rhs, 3), 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.2, TRanker::overlapAtK(lhs, rhs, 10), 1e-12);

    BOOST_REQUIRE_EQUAL(TRanker::orderSeed("focus", "job"), TRanker::orderSeed("focus", "job"));
    BOOST_TEST_REQUIRE(TRanker::orderSeed("focus", "job") != TRanker::orderSeed("focus", "other"));

    TRanker::EMode mode;
    BOOST_TEST_REQUIRE(TRanker::parse("advanced", mode));
    BOOST_REQUIRE_EQUAL(TRanker::E_Advanced, mode);
    BOOST_TEST_REQUIRE(TRanker::parse("expert", mode) == false);
    TRanker::ECooccurrenceMetric metric;
    BOOST_TEST_REQUIRE(TRanker::parse("surprise", metric));
    BOOST_REQUIRE_EQUAL(TRanker::E_Surprise, metric);
    BOOST_REQUIRE_EQUAL("avg_product", TRanker::print(TRanker::E_AvgProduct));
    BOOST_REQUIRE_EQUAL("blend", TRanker::print(TRanker::E_Blend));
    BOOST_REQUIRE_EQUAL("skipped", TRanker::print(TRanker::E_Skipped));
}

BOOST_AUTO_TEST_CASE(testOrderCandidates) {
    analytics::CSensorRegistry registry;
    analytics::CInMemorySampleStore store;
    analytics::CBucketReader reader{registry, store};
    auto add = [&registry](const std::string& id, const std::string& node,
                           const std::string& unit, const std::string& type) {
        analytics::SSensorInfo info;
        info.s_Id = id;
        info.s_NodeId = node;
        info.s_Unit = unit;
        info.s_Type = type;
        registry.addSensor(info);
    };
    add("focus", "n1", "C", "temperature");
    add("same_node", "n1", "%", "humidity");
    add("same_unit", "n2", "C", "humidity");
    add("same_type", "n3", "F", "temperature");
    add("other", "n4", "%", "humidity");
    TRanker ranker{registry, reader};

    auto ordered = ranker.orderCandidates(*registry.sensor("focus"),
                                          {"unknown", "other", "same_type", "same_unit", "same_node"},
                                          TRanker::orderSeed("focus", "job"));
    BOOST_REQUIRE_EQUAL(5, ordered.size());
    BOOST_REQUIRE_EQUAL("same_node", ordered[0]);
    BOOST_REQUIRE_EQUAL("same_unit", ordered[1]);
    BOOST_REQUIRE_EQUAL("same_type", ordered[2]);
    analytics::TStrVec rest{ordered[3], ordered[4]};
    std::sort(rest.begin(), rest.end());
    BOOST_REQUIRE_EQUAL("other", rest[0]);
    BOOST_REQUIRE_EQUAL("unknown", rest[1]);
}

BOOST_AUTO_TEST_CASE(testDerivedDependencyPath) {
    analytics::CSensorRegistry registry;
    analytics::CInMemorySampleStore store;
    analytics::CBucketReader reader{registry, store};
    auto add = [&registry](const std::string& id,
                           const std::optional<analytics::SSensorInfo::SDerivedSpec>& spec) {
        analytics::SSensorInfo info;
        info.s_Id = id;
        info.s_Derived = spec;
        registry.addSensor(info);
    };
    add("focus", std::nullopt);
    add("x", std::nullopt);
    add("d1", derivedFrom("focus", 2.0));
    auto d2 = derivedFrom("x", 1.0);
    d2.s_Inputs.push_back({"d1", 1.0, 60});
    add("d2", d2);
    add("d3", derivedFrom("d2", 1.0));
    add("c1", derivedFrom("c2", 1.0));
    add("c2", derivedFrom("c1", 1.0));
    add("e0", derivedFrom("focus", 1.0));
    for (int i = 1; i < 10; ++i) {
        add("e" + std::to_string(i), derivedFrom("e" + std::to_string(i - 1), 1.0));
    }
    TRanker ranker{registry, reader};

    auto path = ranker.derivedDependencyPath("d3", "focus");
    BOOST_TEST_REQUIRE(path.has_value());
    analytics::TStrVec expected{"d3", "d2", "d1", "focus"};
    BOOST_REQUIRE_EQUAL_COLLECTIONS(expected.begin(), expected.end(), path->begin(), path->end());

    BOOST_TEST_REQUIRE(ranker.derivedDependencyPath("d3", "focus", 2).has_value() == false);
    BOOST_TEST_REQUIRE(ranker.derivedDependencyPath("d3", "focus", 3).has_value());
    BOOST_TEST_REQUIRE(ranker.derivedDependencyPath("x", "focus").has_value() == false);
    BOOST_TEST_REQUIRE(ranker.derivedDependencyPath("focus", "focus").has_value() == false);
    BOOST_TEST_REQUIRE(ranker.derivedDependencyPath("c1", "focus").has_value() == false);

    // Long paths keep their head and the focus.
    path = ranker.derivedDependencyPath("e9", "focus");
    BOOST_TEST_REQUIRE(path.has_value());
    BOOST_REQUIRE_EQUAL(TRanker::MAX_DERIVED_PATH_LENGTH, path->size());
    BOOST_REQUIRE_EQUAL("e9", path->front());
    BOOST_REQUIRE_EQUAL("e3", (*path)[6]);
    BOOST_REQUIRE_EQUAL("focus", path->back());
}

BOOST_AUTO_TEST_CASE(testRankFollowersSimpleMode) {
    CFixture fixture;
    fixture.addStandardSensors();
    fixture.addDerived("doubled", derivedFrom("focus", 2.0));

    auto result = fixture.ranker().compute(fixture.params(), analytics::CAnalysisContext{});

    BOOST_REQUIRE_EQUAL("focus", result.s_FocusSensorId);
    BOOST_REQUIRE_EQUAL(TRanker::E_DeltaZ, result.s_EvidenceSource);
    BOOST_REQUIRE_EQUAL(N, result.s_BucketCount);
    BOOST_REQUIRE_EQUAL(4, result.s_Counts["candidate_pool"]);
    BOOST_REQUIRE_EQUAL(4, result.s_Counts["evaluated_count"]);
    BOOST_REQUIRE_EQUAL(60, result.s_Limits.s_MaxResultsUsed);
    BOOST_REQUIRE_EQUAL(200, result.s_Limits.s_CandidateLimitUsed);

    // The sensor computed from the focus is removed and disclosed.
    BOOST_REQUIRE_EQUAL(2, result.s_Candidates.size());
    BOOST_TEST_REQUIRE(find(result.s_Candidates, "doubled") == nullptr);
    BOOST_REQUIRE_EQUAL(1, countSkipped(result, analytics_t::E_DerivedFromFocus));
    for (const auto& skipped : result.s_Skipped) {
        if (skipped.s_Reason == analytics_t::E_DerivedFromFocus) {
            BOOST_REQUIRE_EQUAL("doubled", skipped.s_SensorId);
            BOOST_REQUIRE_EQUAL("doubled -> focus", skipped.s_Detail);
        }
    }

    const auto& first = result.s_Candidates[0];
    BOOST_REQUIRE_EQUAL("follows", first.s_SensorId);
    BOOST_REQUIRE_EQUAL(1, first.s_Rank);
    BOOST_REQUIRE_EQUAL(analytics_t::E_High, first.s_Confidence);
    BOOST_REQUIRE_EQUAL(60, *first.s_Evidence.s_BestLagSeconds);
    BOOST_REQUIRE_EQUAL(TMatcher::E_Same, *first.s_Evidence.s_Direction);
    BOOST_REQUIRE_EQUAL(3, *first.s_Evidence.s_EventsOverlap);
    BOOST_REQUIRE_EQUAL(3, *first.s_Evidence.s_CooccurrenceCount);
    BOOST_TEST_REQUIRE(first.s_Evidence.s_FocusBucketCoveragePct.has_value());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(100.0, *first.s_Evidence.s_CandidateBucketCoveragePct, 1e-9);
    BOOST_TEST_REQUIRE(first.s_TopBucketTimes.empty() == false);

    const auto& second = result.s_Candidates[1];
    BOOST_REQUIRE_EQUAL("inverse", second.s_SensorId);
    BOOST_REQUIRE_EQUAL(TMatcher::E_Opposite, *second.s_Evidence.s_Direction);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(first.s_BlendedScore, second.s_BlendedScore, 1e-9);

    BOOST_TEST_REQUIRE(find(result.s_Candidates, "unrelated") == nullptr);
    BOOST_TEST_REQUIRE(result.s_Monitoring.has_value());
    BOOST_TEST_REQUIRE(result.s_Stability.has_value() == false);
}

BOOST_AUTO_TEST_CASE(testAdvancedModeLabelsDerived) {
    CFixture fixture;
    fixture.addStandardSensors();
    fixture.addDerived("doubled", derivedFrom("focus", 2.0));

    auto params = fixture.params();
    params.s_Mode = TRanker::E_Advanced;
    auto result = fixture.ranker().compute(params, analytics::CAnalysisContext{});

    BOOST_REQUIRE_EQUAL(0, countSkipped(result, analytics_t::E_DerivedFromFocus));
    const auto* doubled = find(result.s_Candidates, "doubled");
    BOOST_TEST_REQUIRE(doubled != nullptr);
    BOOST_TEST_REQUIRE(doubled->s_DerivedFromFocus);
    analytics::TStrVec expected{"doubled", "focus"};
    BOOST_REQUIRE_EQUAL_COLLECTIONS(expected.begin(), expected.end(),
                                    doubled->s_DerivedDependencyPath.begin(),
                                    doubled->s_DerivedDependencyPath.end());
    BOOST_REQUIRE_EQUAL(0, *doubled->s_Evidence.s_BestLagSeconds);
    BOOST_TEST_REQUIRE(find(result.s_Candidates, "follows") != nullptr);
    BOOST_TEST_REQUIRE(*result.s_ParamsUsed.s_IncludeLowConfidence);
}

BOOST_AUTO_TEST_CASE(testExplicitCandidatesAndPrefilter) {
    CFixture fixture;
    fixture.addStandardSensors();
    fixture.add("sparse", {20.0, 21.0});
    fixture.addForecast("forecast");

    auto params = fixture.params();
    params.s_CandidateSensorIds = {"follows", "sparse", "unrelated", "forecast",
                                   "nothere", "focus", " follows "};
    params.s_Filters.s_ExcludeSensorIds = {"unrelated"};
    auto result = fixture.ranker().compute(params, analytics::CAnalysisContext{});

    BOOST_REQUIRE_EQUAL(1, countSkipped(result, analytics_t::E_Filtered));
    BOOST_REQUIRE_EQUAL(1, countSkipped(result, analytics_t::E_InsufficientOverlap));
    BOOST_REQUIRE_EQUAL(1, countSkipped(result, analytics_t::E_NoHistory));
    BOOST_REQUIRE_EQUAL(1, countSkipped(result, analytics_t::E_SensorNotFound));
    BOOST_REQUIRE_EQUAL(1, result.s_PrefilteredSensorIds.size());
    BOOST_REQUIRE_EQUAL("sparse", result.s_PrefilteredSensorIds[0]);
    BOOST_REQUIRE_EQUAL(1, result.s_Counts["evaluated_count"]);
    BOOST_REQUIRE_EQUAL(1, result.s_Candidates.size());
    BOOST_REQUIRE_EQUAL("follows", result.s_Candidates[0].s_SensorId);
}

BOOST_AUTO_TEST_CASE(testCandidateTruncationAndPins) {
    CFixture fixture;
    fixture.addStandardSensors();
    fixture.addNoise(50);

    auto params = fixture.params();
    params.s_CandidateLimit = 20;
    auto result = fixture.ranker().compute(params, analytics::CAnalysisContext{});

    BOOST_REQUIRE_EQUAL(53, result.s_Counts["candidate_pool"]);
    BOOST_REQUIRE_EQUAL(53, result.s_Counts["eligible_count"]);
    BOOST_REQUIRE_EQUAL(20, result.s_Counts["evaluated_count"]);
    BOOST_REQUIRE_EQUAL(33, result.s_Counts["candidate_truncated"]);
    BOOST_REQUIRE_EQUAL(0, result.s_Counts["candidate_prefiltered"]);
    BOOST_REQUIRE_EQUAL(33, result.s_TruncatedSensorIds.size());
    BOOST_REQUIRE_EQUAL(33, countSkipped(result, analytics_t::E_TruncatedByLimit));

    // The same job key gives the same pool and a different one reshuffles it.
    auto repeat = fixture.ranker().compute(params, analytics::CAnalysisContext{});
    BOOST_REQUIRE_EQUAL_COLLECTIONS(result.s_TruncatedSensorIds.begin(),
                                    result.s_TruncatedSensorIds.end(),
                                    repeat.s_TruncatedSensorIds.begin(),
                                    repeat.s_TruncatedSensorIds.end());
    params.s_JobKey = "another job";
    auto reshuffled = fixture.ranker().compute(params, analytics::CAnalysisContext{});
    BOOST_TEST_REQUIRE((reshuffled.s_TruncatedSensorIds != result.s_TruncatedSensorIds));

    params.s_CandidateLimit = 10;
    params.s_PinnedSensorIds = {"n07", "n03", "ghost", "focus"};
    result = fixture.ranker().compute(params, analytics::CAnalysisContext{});
    BOOST_REQUIRE_EQUAL(2, result.s_Counts["pinned_requested"]);
    BOOST_REQUIRE_EQUAL(2, result.s_Counts["pinned_included"]);
    BOOST_REQUIRE_EQUAL(0, result.s_Counts["pinned_truncated"]);
    BOOST_REQUIRE_EQUAL(10, result.s_Counts["evaluated_count"]);
    BOOST_REQUIRE_EQUAL(43, result.s_TruncatedSensorIds.size());
    BOOST_REQUIRE_EQUAL(1, countSkipped(result, analytics_t::E_SensorNotFound));
    for (const auto& id : result.s_TruncatedSensorIds) {
        BOOST_TEST_REQUIRE(id != "n07");
        BOOST_TEST_REQUIRE(id != "n03");
    }
}

BOOST_AUTO_TEST_CASE(testStability) {
    CFixture fixture;
    fixture.addStandardSensors();

    auto params = fixture.params();
    params.s_StabilityEnabled = true;
    auto result = fixture.ranker().compute(params, analytics::CAnalysisContext{});
    BOOST_TEST_REQUIRE(result.s_Stability.has_value());
    BOOST_REQUIRE_EQUAL(TRanker::E_Computed, result.s_Stability->s_Status);
    BOOST_REQUIRE_EQUAL(3, result.s_Stability->s_Overlaps.size());
    for (auto overlap : result.s_Stability->s_Overlaps) {
        BOOST_TEST_REQUIRE(overlap >= 0.0);
        BOOST_TEST_REQUIRE(overlap <= 1.0);
    }
    BOOST_TEST_REQUIRE(result.s_Stability->s_Tier.has_value());

    // Nothing survives the prefilter in a two bucket window.
    params.s_End = START + 2 * INTERVAL;
    result = fixture.ranker().compute(params, analytics::CAnalysisContext{});
    BOOST_TEST_REQUIRE(result.s_Candidates.empty());
    BOOST_REQUIRE_EQUAL(1, result.s_Warnings.size());
    BOOST_REQUIRE_EQUAL("No candidates evaluated", result.s_Warnings[0]);
    BOOST_REQUIRE_EQUAL(TRanker::E_Skipped, result.s_Stability->s_Status);
    BOOST_REQUIRE_EQUAL("No candidates evaluated", result.s_Stability->s_Reason);
}

BOOST_AUTO_TEST_CASE(testCancellation) {
    CFixture fixture;
    fixture.addStandardSensors();

    core::CCancellationToken token;
    token.cancel();
    analytics::CAnalysisContext context{token, nullptr, nullptr};
    BOOST_REQUIRE_THROW(fixture.ranker().compute(fixture.params(), context),
                        core::CCanceledException);
}

BOOST_AUTO_TEST_CASE(testCooccurrenceFailureKeepsEventEvidence) {
    CFixture fixture;
    fixture.addStandardSensors();

    auto result = fixture.ranker().compute(fixture.params(),
                                           fixture.failReadsBetween("cooccurrence", "merge"));

    BOOST_TEST_REQUIRE(result.s_Warnings.empty() == false);
    BOOST_TEST_REQUIRE(std::any_of(result.s_Warnings.begin(), result.s_Warnings.end(),
                                   [](const std::string& warning) {
                                       return warning.find("cooccurrence stage failed") != std::string::npos &&
                                              warning.find("store unavailable") != std::string::npos;
                                   }));

    BOOST_TEST_REQUIRE(result.s_Candidates.empty() == false);
    const auto* follows = find(result.s_Candidates, "follows");
    BOOST_TEST_REQUIRE(follows != nullptr);
    BOOST_REQUIRE_EQUAL(3, *follows->s_Evidence.s_EventsOverlap);
    BOOST_REQUIRE_EQUAL(60, *follows->s_Evidence.s_BestLagSeconds);
    BOOST_TEST_REQUIRE(follows->s_Evidence.s_CooccurrenceCount.has_value() == false);
    BOOST_TEST_REQUIRE(find(result.s_Candidates, "inverse") != nullptr);
}

BOOST_AUTO_TEST_CASE(testEventFailureKeepsCooccurrenceEvidence) {
    CFixture fixture;
    fixture.addStandardSensors();

    auto result = fixture.ranker().compute(fixture.params(),
                                           fixture.failReadsBetween("events", "cooccurrence"));

    BOOST_TEST_REQUIRE(std::any_of(result.s_Warnings.begin(), result.s_Warnings.end(),
                                   [](const std::string& warning) {
                                       return warning.find("events stage failed") != std::string::npos;
                                   }));

    BOOST_TEST_REQUIRE(result.s_Candidates.empty() == false);
    const auto* follows = find(result.s_Candidates, "follows");
    BOOST_TEST_REQUIRE(follows != nullptr);
    BOOST_REQUIRE_EQUAL(1, follows->s_Rank);
    BOOST_REQUIRE_EQUAL(3, *follows->s_Evidence.s_CooccurrenceCount);
    BOOST_TEST_REQUIRE(follows->s_Evidence.s_EventsOverlap.has_value() == false);
}

BOOST_AUTO_TEST_CASE(testAllStagesFailing) {
    CFixture fixture;
    fixture.addStandardSensors();

    BOOST_REQUIRE_THROW(fixture.ranker().compute(fixture.params(),
                                                 fixture.failReadsBetween("events", "merge")),
                        std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
