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

#include <maths/CRobustStatistics.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <limits>
#include <vector>

BOOST_AUTO_TEST_SUITE(CRobustStatisticsTest)

using namespace tsse;

using TDoubleVec = std::vector<double>;

BOOST_AUTO_TEST_CASE(testMedianAndQuantile) {
    BOOST_TEST_REQUIRE((maths::CRobustStatistics::median(TDoubleVec{}) == std::nullopt));
    BOOST_REQUIRE_EQUAL(3.0, *maths::CRobustStatistics::median(TDoubleVec{5.0, 1.0, 3.0}));
    BOOST_REQUIRE_EQUAL(2.5, *maths::CRobustStatistics::median(TDoubleVec{4.0, 1.0, 3.0, 2.0}));

    double nan{std::numeric_limits<double>::quiet_NaN()};
    BOOST_REQUIRE_EQUAL(2.0, *maths::CRobustStatistics::median(TDoubleVec{nan, 1.0, 2.0, 3.0}));

    TDoubleVec values{1.0, 2.0, 3.0, 4.0};
    BOOST_REQUIRE_EQUAL(2.5, *maths::CRobustStatistics::quantile(values, 0.5));
    BOOST_REQUIRE_EQUAL(1.0, *maths::CRobustStatistics::quantile(values, 0.0));
    BOOST_REQUIRE_EQUAL(4.0, *maths::CRobustStatistics::quantile(values, 1.0));
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.75, *maths::CRobustStatistics::quantile(values, 0.25), 1e-12);
    BOOST_TEST_REQUIRE((maths::CRobustStatistics::quantile(values, 1.5) == std::nullopt));
    BOOST_REQUIRE_EQUAL(7.0, *maths::CRobustStatistics::quantile(TDoubleVec{7.0}, 0.9));
}

BOOST_AUTO_TEST_CASE(testRobustScale) {
    // Too few values.
    BOOST_TEST_REQUIRE((maths::CRobustStatistics::robustScale(TDoubleVec{1.0, 2.0}) ==
                       std::nullopt));

    // MAD is unaffected by the outlier.
    auto scale = maths::CRobustStatistics::robustScale(TDoubleVec{1.0, 2.0, 3.0, 4.0, 100.0});
    BOOST_TEST_REQUIRE((scale != std::nullopt));
    BOOST_REQUIRE_EQUAL(3.0, scale->s_Center);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.4826, scale->s_Scale, 1e-12);

    // Zero MAD falls back to IQR / 1.349.
    scale = maths::CRobustStatistics::robustScale(
        TDoubleVec{0.0, 0.0, 0.0, 0.0, 0.0, 1.0, 2.0, 3.0});
    BOOST_TEST_REQUIRE((scale != std::nullopt));
    BOOST_REQUIRE_EQUAL(0.0, scale->s_Center);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.25 / 1.349, scale->s_Scale, 1e-12);

    // Zero MAD and IQR gives unit scale.
    scale = maths::CRobustStatistics::robustScale(TDoubleVec{5.0, 5.0, 5.0, 5.0, 6.0});
    BOOST_TEST_REQUIRE((scale != std::nullopt));
    BOOST_REQUIRE_EQUAL(5.0, scale->s_Center);
    BOOST_REQUIRE_EQUAL(1.0, scale->s_Scale);
}

BOOST_AUTO_TEST_CASE(testRobustScaleOfNormalSamples) {
    test::CRandomNumbers rng;
    TDoubleVec samples;
    rng.generateNormalSamples(10.0, 4.0, 5000, samples);

    auto scale = maths::CRobustStatistics::robustScale(samples);
    BOOST_TEST_REQUIRE((scale != std::nullopt));
    LOG_DEBUG(<< "center = " << scale->s_Center << ", scale = " << scale->s_Scale);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(10.0, scale->s_Center, 0.15);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(2.0, scale->s_Scale, 0.15);
}

BOOST_AUTO_TEST_CASE(testZScores) {
    double nan{std::numeric_limits<double>::quiet_NaN()};
    TDoubleVec z{maths::CRobustStatistics::zScores(TDoubleVec{0.0, 2.0, nan, 100.0}, 1.0, 0.5, 6.0)};
    BOOST_REQUIRE_EQUAL(4, z.size());
    BOOST_REQUIRE_EQUAL(-2.0, z[0]);
    BOOST_REQUIRE_EQUAL(2.0, z[1]);
    BOOST_TEST_REQUIRE(std::isnan(z[2]));
    BOOST_REQUIRE_EQUAL(6.0, z[3]);

    // Non-positive scale is treated as one and clip <= 0 disables clipping.
    z = maths::CRobustStatistics::zScores(TDoubleVec{10.0}, 0.0, 0.0, 0.0);
    BOOST_REQUIRE_EQUAL(10.0, z[0]);
}

BOOST_AUTO_TEST_CASE(testAverageRanks) {
    TDoubleVec ranks{maths::CRobustStatistics::averageRanks(TDoubleVec{10.0, 20.0, 20.0, 5.0})};
    BOOST_REQUIRE_EQUAL(4, ranks.size());
    BOOST_REQUIRE_EQUAL(2.0, ranks[0]);
    BOOST_REQUIRE_EQUAL(3.5, ranks[1]);
    BOOST_REQUIRE_EQUAL(3.5, ranks[2]);
    BOOST_REQUIRE_EQUAL(1.0, ranks[3]);

    ranks = maths::CRobustStatistics::averageRanks(TDoubleVec{1.0, 1.0, 1.0});
    for (auto rank : ranks) {
        BOOST_REQUIRE_EQUAL(2.0, rank);
    }
}

BOOST_AUTO_TEST_SUITE_END()
