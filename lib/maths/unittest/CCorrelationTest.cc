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

#include <maths/CCorrelation.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <limits>
#include <vector>

BOOST_AUTO_TEST_SUITE(CCorrelationTest)

using namespace tsse;

using TDoubleVec = std::vector<double>;
using TDoubleVecVec = std::vector<TDoubleVec>;

namespace {
double referencePearson(const TDoubleVec& x, const TDoubleVec& y) {
    double n{static_cast<double>(x.size())};
    double mx{0.0};
    double my{0.0};
    for (std::size_t i = 0; i < x.size(); ++i) {
        mx += x[i];
        my += y[i];
    }
    mx /= n;
    my /= n;
    double sxy{0.0};
    double sxx{0.0};
    double syy{0.0};
    for (std::size_t i = 0; i < x.size(); ++i) {
        sxy += (x[i] - mx) * (y[i] - my);
        sxx += (x[i] - mx) * (x[i] - mx);
        syy += (y[i] - my) * (y[i] - my);
    }
    return sxy / std::sqrt(sxx * syy);
}
}

BOOST_AUTO_TEST_CASE(testPearsonMatchesReferenceAndIsSymmetric) {
    test::CRandomNumbers rng;

    double rhos[]{-0.9, -0.3, 0.0, 0.5, 0.95};
    for (auto rho : rhos) {
        TDoubleVecVec samples;
        rng.generateMultivariateNormalSamples({20.0, 5.0}, {{4.0, 2.0 * rho}, {2.0 * rho, 1.0}},
                                              500, samples);
        TDoubleVec x;
        TDoubleVec y;
        for (const auto& sample : samples) {
            x.push_back(sample[0]);
            y.push_back(sample[1]);
        }

        auto rxy = maths::CCorrelation::pearson(x, y);
        auto ryx = maths::CCorrelation::pearson(y, x);
        BOOST_TEST_REQUIRE(rxy.has_value());
        BOOST_TEST_REQUIRE(ryx.has_value());
        LOG_DEBUG(<< "rho = " << rho << ", r = " << *rxy);

        BOOST_REQUIRE_CLOSE_ABSOLUTE(referencePearson(x, y), *rxy, 1e-9);
        BOOST_REQUIRE_EQUAL(*rxy, *ryx);
        BOOST_REQUIRE_CLOSE_ABSOLUTE(rho, *rxy, 0.1);
    }
}

BOOST_AUTO_TEST_CASE(testPearsonDegenerate) {
    BOOST_TEST_REQUIRE(
        maths::CCorrelation::pearson({1.0, 1.0, 1.0}, {1.0, 2.0, 3.0}).has_value() == false);
    BOOST_TEST_REQUIRE(maths::CCorrelation::pearson({1.0}, {1.0}).has_value() == false);

    double nan{std::numeric_limits<double>::quiet_NaN()};
    auto r = maths::CCorrelation::pearson({1.0, 2.0, nan, 3.0}, {2.0, 4.0, 100.0, 6.0});
    BOOST_TEST_REQUIRE(r.has_value());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, *r, 1e-12);
}

BOOST_AUTO_TEST_CASE(testSpearman) {
    TDoubleVec x;
    TDoubleVec y;
    for (std::size_t i = 0; i < 30; ++i) {
        x.push_back(static_cast<double>(i));
        y.push_back(std::exp(0.3 * static_cast<double>(i)));
    }
    auto rho = maths::CCorrelation::spearman(x, y);
    BOOST_TEST_REQUIRE(rho.has_value());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, *rho, 1e-12);

    auto r = maths::CCorrelation::pearson(x, y);
    BOOST_TEST_REQUIRE(*r < 0.9);
}

BOOST_AUTO_TEST_CASE(testBestWithinLag) {
    test::CRandomNumbers rng;
    TDoubleVec values;
    rng.generateUniformSamples(0.0, 10.0, 20, values);

    // b repeats a one bucket later.
    maths::CCorrelation::TTimeDoublePrVec a;
    maths::CCorrelation::TTimeDoublePrVec b;
    for (core_t::TTime i = 0; i < 20; ++i) {
        a.emplace_back(i * 60, values[i]);
        b.emplace_back((i + 1) * 60, values[i]);
    }

    auto best = maths::CCorrelation::bestWithinLag(a, b, maths::CCorrelation::E_Pearson, 3, 60, 2);
    BOOST_REQUIRE_EQUAL(60, best.s_LagSeconds);
    BOOST_REQUIRE_EQUAL(20, best.s_N);
    BOOST_TEST_REQUIRE(best.s_R.has_value());
    BOOST_TEST_REQUIRE(*best.s_R > 0.999);

    auto aligned = maths::CCorrelation::atLag(a, b, 0, maths::CCorrelation::E_Spearman, 3);
    BOOST_REQUIRE_EQUAL(19, aligned.s_N);

    auto tooFew = maths::CCorrelation::atLag(a, b, 0, maths::CCorrelation::E_Pearson, 50);
    BOOST_TEST_REQUIRE(tooFew.s_R.has_value() == false);
    BOOST_REQUIRE_EQUAL(19, tooFew.s_N);
}

BOOST_AUTO_TEST_CASE(testLag1AutocorrelationAndEffectiveSampleSize) {
    BOOST_TEST_REQUIRE(maths::CCorrelation::lag1Autocorrelation({1.0, 2.0}).has_value() == false);

    TDoubleVec trend;
    for (std::size_t i = 0; i < 50; ++i) {
        trend.push_back(static_cast<double>(i));
    }
    auto rho = maths::CCorrelation::lag1Autocorrelation(trend);
    BOOST_TEST_REQUIRE(rho.has_value());
    BOOST_TEST_REQUIRE(*rho <= maths::CCorrelation::MAX_ABS_R);
    BOOST_TEST_REQUIRE(*rho > 0.999);

    BOOST_REQUIRE_EQUAL(66, maths::CCorrelation::effectiveSampleSize(100, 0.5, 0.5));
    BOOST_REQUIRE_EQUAL(100, maths::CCorrelation::effectiveSampleSize(100, 0.5, -0.5));
    BOOST_REQUIRE_EQUAL(100, maths::CCorrelation::effectiveSampleSize(100, std::nullopt, 0.5));
    BOOST_REQUIRE_EQUAL(2, maths::CCorrelation::effectiveSampleSize(2, 0.9, 0.9));
    BOOST_REQUIRE_EQUAL(3, maths::CCorrelation::effectiveSampleSize(4, 0.99, 0.99));

    // Non-increasing in the autocorrelation.
    std::size_t last{1000};
    for (double r = 0.0; r < 1.0; r += 0.1) {
        std::size_t nEff{maths::CCorrelation::effectiveSampleSize(1000, r, r)};
        BOOST_TEST_REQUIRE(nEff <= last);
        last = nEff;
    }
}

BOOST_AUTO_TEST_CASE(testPValues) {
    BOOST_TEST_REQUIRE(maths::CCorrelation::pearsonPValue(0.5, 3).has_value() == false);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, *maths::CCorrelation::pearsonPValue(0.0, 10), 1e-12);

    double p{*maths::CCorrelation::pearsonPValue(0.5, 28)};
    LOG_DEBUG(<< "p = " << p);
    BOOST_TEST_REQUIRE(p > 0.005);
    BOOST_TEST_REQUIRE(p < 0.007);

    BOOST_REQUIRE_EQUAL(std::numeric_limits<double>::min(),
                        *maths::CCorrelation::pearsonPValue(1.0, 100));
    BOOST_TEST_REQUIRE(*maths::CCorrelation::pearsonPValue(0.9, 10000) > 0.0);

    double ps{*maths::CCorrelation::spearmanPValue(0.5, 28)};
    LOG_DEBUG(<< "p = " << ps);
    BOOST_TEST_REQUIRE(ps > 0.003);
    BOOST_TEST_REQUIRE(ps < 0.01);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, *maths::CCorrelation::spearmanPValue(0.0, 20), 1e-12);

    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.959964, *maths::CCorrelation::zValueForAlpha(0.05), 1e-6);
    BOOST_TEST_REQUIRE(maths::CCorrelation::zValueForAlpha(0.0).has_value() == false);

    auto interval = maths::CCorrelation::fisherZInterval(0.5, 28, 1.959964);
    BOOST_TEST_REQUIRE(interval.has_value());
    BOOST_TEST_REQUIRE(interval->first < 0.5);
    BOOST_TEST_REQUIRE(interval->second > 0.5);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(std::tanh(std::atanh(0.5) - 1.959964 / 5.0), interval->first, 1e-9);
}

BOOST_AUTO_TEST_CASE(testBenjaminiHochberg) {
    TDoubleVec q{maths::CCorrelation::benjaminiHochberg({0.01, 0.04, 0.03, 0.005})};
    BOOST_REQUIRE_EQUAL(4, q.size());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.02, q[0], 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.04, q[1], 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.04, q[2], 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.02, q[3], 1e-12);

    q = maths::CCorrelation::benjaminiHochberg({0.9, 0.8});
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.9, q[0], 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.9, q[1], 1e-12);

    BOOST_TEST_REQUIRE(maths::CCorrelation::benjaminiHochberg({}).empty());
}

BOOST_AUTO_TEST_CASE(testSignificanceNeedsEffectSize) {
    BOOST_TEST_REQUIRE(maths::CCorrelation::isSignificant(0.01, 0.05, 0.05, 0.2) == false);
    BOOST_TEST_REQUIRE(maths::CCorrelation::isSignificant(0.01, -0.42, 0.05, 0.2));
    BOOST_TEST_REQUIRE(maths::CCorrelation::isSignificant(0.06, 0.9, 0.05, 0.2) == false);
}

BOOST_AUTO_TEST_SUITE_END()
