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

#include <analytics/CSeriesEmbedding.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <vector>

BOOST_AUTO_TEST_SUITE(CSeriesEmbeddingTest)

using namespace tsse;

namespace {
using TDoubleVec = std::vector<double>;

analytics::SSeries makeSeries(const TDoubleVec& values) {
    analytics::SSeries result;
    result.s_Interval = 60;
    for (std::size_t i = 0; i < values.size(); ++i) {
        analytics::SBucket bucket;
        bucket.s_Time = 1700000040 + static_cast<core_t::TTime>(i) * 60;
        bucket.s_Value = values[i];
        result.s_Buckets.push_back(bucket);
    }
    return result;
}
}

BOOST_AUTO_TEST_CASE(testDimensionAndNormalisation) {
    test::CRandomNumbers rng;
    TDoubleVec values;
    rng.generateNormalSamples(15.0, 4.0, 500, values);

    auto embedding = analytics::CSeriesEmbedding::compute(makeSeries(values));
    BOOST_TEST_REQUIRE(embedding.has_value());
    BOOST_REQUIRE_EQUAL(analytics::CSeriesEmbedding::DIMENSION, embedding->size());
    double norm{0.0};
    for (auto feature : *embedding) {
        BOOST_TEST_REQUIRE(std::isfinite(feature));
        norm += feature * feature;
    }
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, norm, 1e-9);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, analytics::CSeriesEmbedding::cosineSimilarity(*embedding, *embedding), 1e-9);

    BOOST_TEST_REQUIRE(analytics::CSeriesEmbedding::compute(makeSeries({1.0, 2.0})).has_value() == false);
}

BOOST_AUTO_TEST_CASE(testSimilarDistributionsAreClose) {
    test::CRandomNumbers rng;
    TDoubleVec a;
    TDoubleVec b;
    TDoubleVec c;
    rng.generateNormalSamples(15.0, 4.0, 1000, a);
    rng.generateNormalSamples(15.0, 4.0, 1000, b);
    rng.generateUniformSamples(900.0, 1100.0, 1000, c);

    auto ea = analytics::CSeriesEmbedding::compute(makeSeries(a));
    auto eb = analytics::CSeriesEmbedding::compute(makeSeries(b));
    auto ec = analytics::CSeriesEmbedding::compute(makeSeries(c));
    double ab{analytics::CSeriesEmbedding::cosineSimilarity(*ea, *eb)};
    double ac{analytics::CSeriesEmbedding::cosineSimilarity(*ea, *ec)};
    LOG_DEBUG(<< "similarity same = " << ab << ", different = " << ac);
    BOOST_TEST_REQUIRE(ab > 0.99);
    BOOST_TEST_REQUIRE(ab > ac);

    auto shortlist = analytics::CSeriesEmbedding::shortlist(*ea, {{"c", *ec}, {"b", *eb}}, 1);
    BOOST_REQUIRE_EQUAL(1, shortlist.size());
    BOOST_REQUIRE_EQUAL("b", shortlist[0].first);
}

BOOST_AUTO_TEST_CASE(testShortlistTiesBreakById) {
    TDoubleVec focus{1.0, 0.0};
    auto shortlist = analytics::CSeriesEmbedding::shortlist(
        focus, {{"z", {1.0, 0.0}}, {"a", {2.0, 0.0}}, {"m", {0.0, 1.0}}}, 5);
    BOOST_REQUIRE_EQUAL(3, shortlist.size());
    BOOST_REQUIRE_EQUAL("a", shortlist[0].first);
    BOOST_REQUIRE_EQUAL("z", shortlist[1].first);
    BOOST_REQUIRE_EQUAL("m", shortlist[2].first);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, shortlist[2].second, 1e-12);

    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, analytics::CSeriesEmbedding::cosineSimilarity({0.0, 0.0}, focus), 1e-12);
}

BOOST_AUTO_TEST_SUITE_END()
