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
#include <core/CLogger.h>

#include <analytics/CAnalysisContext.h>
#include <analytics/CBucketReader.h>
#include <analytics/CCooccurrenceScorer.h>
#include <analytics/CSampleStore.h>
#include <analytics/CSensorRegistry.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <cstdlib>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(CCooccurrenceScorerTest)

using namespace tsse;

namespace {
using TDoubleVec = std::vector<double>;
using TSizeVec = std::vector<std::size_t>;
using TScorer = analytics::CCooccurrenceScorer;

const core_t::TTime START{28333333 * 60};
const core_t::TTime INTERVAL{60};
const std::size_t N{1000};

core_t::TTime bucketTime(std::size_t i) {
    return START + static_cast<core_t::TTime>(i) * INTERVAL;
}

analytics::SEvent event(std::size_t bucket, double z) {
    analytics::SEvent result;
    result.s_Time = bucketTime(bucket);
    result.s_Z = z;
    result.s_Direction = z >= 0.0 ? analytics_t::E_Up : analytics_t::E_Down;
    return result;
}

double specificScore(double severity, double g, double n) {
    return severity / g / std::log(2.0 + g) * std::log((n + 1.0) / (g + 1.0));
}

TScorer::SScoringOptions options(std::size_t tolerance) {
    TScorer::SScoringOptions result;
    result.s_Interval = INTERVAL;
    result.s_ToleranceBuckets = tolerance;
    return result;
}

//! Four sensors: a and b move together in bucket 10, a, b and c in bucket
//! 20, all four in bucket 30 and c alone in bucket 40.
TScorer::TStrEventVecMap grid() {
    TScorer::TStrEventVecMap result;
    result["a"] = {event(10, 5.0), event(20, 5.0), event(30, 5.0)};
    result["b"] = {event(10, -4.0), event(20, 5.0), event(30, 5.0)};
    result["c"] = {event(20, 5.0), event(30, 5.0), event(40, 9.0)};
    result["d"] = {event(30, 5.0)};
    return result;
}

TDoubleVec pulses(test::CRandomNumbers& rng, const TSizeVec& at) {
    TDoubleVec result;
    rng.generateNormalSamples(20.0, 0.01, N, result);
    for (auto i : at) {
        result[i] += 10.0;
        result[i + 1] += 5.0;
    }
    return result;
}
}

BOOST_AUTO_TEST_CASE(testBucketScore) {
    auto score = TScorer::bucketScore(TScorer::E_PreferSpecific, 9.0, 2, 4);
    BOOST_TEST_REQUIRE(score.has_value());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(specificScore(9.0, 2.0, 4.0), score->s_Score, 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0 / std::log(4.0), score->s_PairWeight, 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(std::log(5.0 / 3.0), *score->s_Idf, 1e-12);

    // A bucket in which every sensor moved carries no information.
    auto everyone = TScorer::bucketScore(TScorer::E_PreferSpecific, 20.0, 4, 4);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, everyone->s_Score, 1e-12);
    BOOST_TEST_REQUIRE(everyone->s_Score < score->s_Score);

    auto systemWide = TScorer::bucketScore(TScorer::E_PreferSystemWide, 20.0, 4, 4);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(20.0, systemWide->s_Score, 1e-12);
    BOOST_TEST_REQUIRE(systemWide->s_Idf.has_value() == false);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, systemWide->s_PairWeight, 1e-12);

    BOOST_TEST_REQUIRE(TScorer::bucketScore(TScorer::E_PreferSpecific, 0.0, 2, 4).has_value() == false);
    BOOST_TEST_REQUIRE(TScorer::bucketScore(TScorer::E_PreferSystemWide,
                                            std::nan(""), 2, 4).has_value() == false);
}

BOOST_AUTO_TEST_CASE(testSpecificPreference) {
    auto buckets = TScorer::score(grid(), 4, options(0), analytics::CAnalysisContext{});

    BOOST_REQUIRE_EQUAL(2, buckets.size());
    BOOST_REQUIRE_EQUAL(bucketTime(10), buckets[0].s_Time);
    BOOST_REQUIRE_EQUAL(2, buckets[0].s_GroupSize);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(9.0, buckets[0].s_SeveritySum, 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(specificScore(9.0, 2.0, 4.0), buckets[0].s_Score, 1e-12);
    BOOST_REQUIRE_EQUAL("a", buckets[0].s_Sensors[0].s_SensorId);
    BOOST_REQUIRE_EQUAL(analytics_t::E_Down, buckets[0].s_Sensors[1].s_Direction);
    BOOST_TEST_REQUIRE(buckets[0].s_FocusStrength.has_value() == false);
    BOOST_REQUIRE_EQUAL(bucketTime(20), buckets[1].s_Time);
    BOOST_REQUIRE_EQUAL(3, buckets[1].s_GroupSize);
}

BOOST_AUTO_TEST_CASE(testSystemWidePreference) {
    auto scoring = options(0);
    scoring.s_Preference = TScorer::E_PreferSystemWide;
    auto buckets = TScorer::score(grid(), 4, scoring, analytics::CAnalysisContext{});

    BOOST_REQUIRE_EQUAL(3, buckets.size());
    BOOST_REQUIRE_EQUAL(bucketTime(30), buckets[0].s_Time);
    BOOST_REQUIRE_EQUAL(4, buckets[0].s_GroupSize);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(20.0, buckets[0].s_Score, 1e-12);
    BOOST_REQUIRE_EQUAL(bucketTime(20), buckets[1].s_Time);
    BOOST_REQUIRE_EQUAL(bucketTime(10), buckets[2].s_Time);

    scoring.s_MaxResults = 1;
    BOOST_REQUIRE_EQUAL(1, TScorer::score(grid(), 4, scoring, analytics::CAnalysisContext{}).size());
    scoring.s_MaxResults = 32;
    scoring.s_MinSensors = 4;
    buckets = TScorer::score(grid(), 4, scoring, analytics::CAnalysisContext{});
    BOOST_REQUIRE_EQUAL(1, buckets.size());
    BOOST_REQUIRE_EQUAL(bucketTime(30), buckets[0].s_Time);
}

BOOST_AUTO_TEST_CASE(testFocusOrdersByFocusStrength) {
    auto events = grid();
    events["c"] = {event(20, 3.0), event(30, 5.0), event(50, 8.0)};
    events["a"].push_back(event(50, 2.0));

    auto scoring = options(0);
    scoring.s_FocusSensorId = "c";
    auto buckets = TScorer::score(events, 4, scoring, analytics::CAnalysisContext{});

    // Bucket 30 contains every sensor and scores zero.
    BOOST_REQUIRE_EQUAL(2, buckets.size());
    BOOST_REQUIRE_EQUAL(bucketTime(50), buckets[0].s_Time);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(8.0, *buckets[0].s_FocusStrength, 1e-12);
    BOOST_REQUIRE_EQUAL(bucketTime(20), buckets[1].s_Time);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(3.0, *buckets[1].s_FocusStrength, 1e-12);
    for (const auto& bucket : buckets) {
        bool hasFocus{false};
        for (const auto& sensor : bucket.s_Sensors) {
            hasFocus = hasFocus || sensor.s_SensorId == "c";
        }
        BOOST_TEST_REQUIRE(hasFocus);
    }

    // Without focus buckets which don't contain c are also selected.
    scoring.s_FocusSensorId.reset();
    buckets = TScorer::score(events, 4, scoring, analytics::CAnalysisContext{});
    BOOST_REQUIRE_EQUAL(3, buckets.size());
    BOOST_REQUIRE_EQUAL(bucketTime(50), buckets[0].s_Time);
    BOOST_REQUIRE_EQUAL(bucketTime(10), buckets[1].s_Time);
    BOOST_REQUIRE_EQUAL(bucketTime(20), buckets[2].s_Time);

    scoring.s_FocusSensorId = "nobody";
    BOOST_TEST_REQUIRE(TScorer::score(events, 4, scoring, analytics::CAnalysisContext{}).empty());
}

BOOST_AUTO_TEST_CASE(testToleranceAndBlocking) {
    TScorer::TStrEventVecMap events;
    events["a"] = {event(100, 6.0)};
    events["b"] = {event(101, 6.0)};

    BOOST_TEST_REQUIRE(TScorer::score(events, 3, options(0), analytics::CAnalysisContext{}).empty());

    auto buckets = TScorer::score(events, 3, options(1), analytics::CAnalysisContext{});
    BOOST_REQUIRE_EQUAL(1, buckets.size());
    BOOST_TEST_REQUIRE(buckets[0].s_Time >= bucketTime(100));
    BOOST_TEST_REQUIRE(buckets[0].s_Time <= bucketTime(101));
    BOOST_REQUIRE_EQUAL(2, buckets[0].s_GroupSize);
    // Participants keep their own event times.
    for (const auto& sensor : buckets[0].s_Sensors) {
        BOOST_REQUIRE_EQUAL(sensor.s_SensorId == "a" ? bucketTime(100) : bucketTime(101),
                            sensor.s_Time);
    }

    // A second coincidence outside the blocked range is also selected.
    events["a"].push_back(event(200, 6.0));
    events["b"].push_back(event(201, 6.0));
    buckets = TScorer::score(events, 3, options(1), analytics::CAnalysisContext{});
    BOOST_REQUIRE_EQUAL(2, buckets.size());
    BOOST_TEST_REQUIRE(std::abs(buckets[0].s_Time - buckets[1].s_Time) > INTERVAL);
}

BOOST_AUTO_TEST_CASE(testEntropyWeightsAndZCap) {
    TScorer::TStrEventVecMap events;
    events["a"] = {event(10, 40.0)};
    events["b"] = {event(10, 4.0)};

    auto scoring = options(0);
    auto buckets = TScorer::score(events, 5, scoring, analytics::CAnalysisContext{});
    BOOST_REQUIRE_CLOSE_ABSOLUTE(19.0, buckets[0].s_SeveritySum, 1e-12);

    scoring.s_EntropyWeights["a"] = 0.5;
    buckets = TScorer::score(events, 5, scoring, analytics::CAnalysisContext{});
    BOOST_REQUIRE_CLOSE_ABSOLUTE(11.5, buckets[0].s_SeveritySum, 1e-12);

    auto stats = TScorer::sensorStats({event(1, 3.0), event(2, -20.0)}, 15.0);
    BOOST_REQUIRE_EQUAL(2, stats.s_NumberEvents);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(9.0, stats.s_MeanAbsZ, 1e-12);
    BOOST_REQUIRE_EQUAL(0, TScorer::sensorStats({}, 15.0).s_NumberEvents);
}

BOOST_AUTO_TEST_CASE(testComputeFromStore) {
    analytics::CSensorRegistry registry;
    analytics::CInMemorySampleStore store;
    test::CRandomNumbers rng;
    auto add = [&](const std::string& id, const TSizeVec& at) {
        analytics::SSensorInfo info;
        info.s_Id = id;
        info.s_Type = "temperature";
        registry.addSensor(info);
        TDoubleVec values{pulses(rng, at)};
        for (std::size_t i = 0; i < values.size(); ++i) {
            store.addSample(id, {bucketTime(i), values[i]});
        }
    };
    add("s1", {200, 600});
    add("s2", {200, 600});
    add("s3", {200});
    add("s4", {400});
    analytics::CBucketReader reader{registry, store};
    TScorer scorer{registry, reader};

    TScorer::SParams params;
    params.s_SensorIds = {"s4", "s3", "s2", "s1", "missing"};
    params.s_Start = START;
    params.s_End = bucketTime(N);
    params.s_Interval = INTERVAL;
    params.s_Detector.s_ZThreshold = 6.0;
    params.s_FocusSensorId = std::string{"  zzz "};
    auto result = scorer.compute(params, analytics::CAnalysisContext{});

    BOOST_REQUIRE_EQUAL(N, result.s_BucketCount);
    BOOST_REQUIRE_EQUAL(1, result.s_Skipped.size());
    BOOST_REQUIRE_EQUAL(1, result.s_Warnings.size());
    BOOST_REQUIRE_EQUAL("zzz", *result.s_ParamsUsed.s_FocusSensorId);
    BOOST_REQUIRE_EQUAL(6, result.s_EventCount);
    BOOST_REQUIRE_EQUAL(2, result.s_SensorStats["s1"].s_NumberEvents);
    BOOST_REQUIRE_EQUAL(0, result.s_SensorStats["missing"].s_NumberEvents);

    // Focus on a sensor which isn't scored matches nothing.
    BOOST_TEST_REQUIRE(result.s_Buckets.empty());

    params.s_FocusSensorId.reset();
    result = scorer.compute(params, analytics::CAnalysisContext{});
    // Each coincidence is spread over five buckets and blocking only covers
    // the tolerance so it yields two selections. The pair is rarer than the
    // triple so it ranks first.
    BOOST_REQUIRE_EQUAL(4, result.s_Buckets.size());
    for (std::size_t i = 0; i < 2; ++i) {
        BOOST_REQUIRE_EQUAL(2, result.s_Buckets[i].s_GroupSize);
        BOOST_TEST_REQUIRE(std::abs(result.s_Buckets[i].s_Time - bucketTime(600)) <= 2 * INTERVAL);
        BOOST_REQUIRE_EQUAL(3, result.s_Buckets[i + 2].s_GroupSize);
        BOOST_TEST_REQUIRE(std::abs(result.s_Buckets[i + 2].s_Time - bucketTime(200)) <= 2 * INTERVAL);
    }
    BOOST_REQUIRE_EQUAL(bucketTime(602), result.s_Buckets[0].s_Time);
    BOOST_REQUIRE_EQUAL(bucketTime(599), result.s_Buckets[1].s_Time);

    params.s_Preference = TScorer::E_PreferSystemWide;
    result = scorer.compute(params, analytics::CAnalysisContext{});
    BOOST_REQUIRE_EQUAL(3, result.s_Buckets[0].s_GroupSize);
    BOOST_TEST_REQUIRE(std::abs(result.s_Buckets[0].s_Time - bucketTime(200)) <= 2 * INTERVAL);

    params.s_FocusSensorId = std::string{"s3"};
    result = scorer.compute(params, analytics::CAnalysisContext{});
    BOOST_REQUIRE_EQUAL(1, result.s_Buckets.size());
    BOOST_REQUIRE_EQUAL(bucketTime(200), result.s_Buckets[0].s_Time);
    BOOST_TEST_REQUIRE(result.s_Warnings.empty());

    params.s_MaxSensors = 2;
    result = scorer.compute(params, analytics::CAnalysisContext{});
    BOOST_REQUIRE_EQUAL(3, result.s_TruncatedSensorIds.size());
    BOOST_REQUIRE_EQUAL(2, result.s_ParamsUsed.s_SensorIds.size());
}

BOOST_AUTO_TEST_CASE(testClampAndParse) {
    TScorer::SParams params;
    params.s_SensorIds = {"a", "b", "c"};
    params.s_MinSensors = 10;
    params.s_ToleranceBuckets = 1000;
    params.s_MaxResults = 0;
    TScorer::clamp(params);
    BOOST_REQUIRE_EQUAL(3, params.s_MinSensors);
    BOOST_REQUIRE_EQUAL(TScorer::MAX_TOLERANCE_BUCKETS, params.s_ToleranceBuckets);
    BOOST_REQUIRE_EQUAL(1, params.s_MaxResults);

    TScorer::EBucketPreference preference;
    BOOST_TEST_REQUIRE(TScorer::parse("system_wide", preference));
    BOOST_REQUIRE_EQUAL(TScorer::E_PreferSystemWide, preference);
    BOOST_TEST_REQUIRE(TScorer::parse("prefer_specific_matches", preference));
    BOOST_REQUIRE_EQUAL(TScorer::E_PreferSpecific, preference);
    BOOST_TEST_REQUIRE(TScorer::parse("everything", preference) == false);
    BOOST_REQUIRE_EQUAL("prefer_system_wide_matches", TScorer::print(TScorer::E_PreferSystemWide));
}

BOOST_AUTO_TEST_SUITE_END()
