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
#include <core/CTimeUtils.h>

#include <boost/test/unit_test.hpp>

#include <string>

BOOST_AUTO_TEST_SUITE(CTimeUtilsTest)

using namespace tsse;

BOOST_AUTO_TEST_CASE(testToIso8601) {
    BOOST_REQUIRE_EQUAL("1970-01-01T00:00:00Z", core::CTimeUtils::toIso8601(0));
    BOOST_REQUIRE_EQUAL("2023-11-14T22:13:20Z", core::CTimeUtils::toIso8601(1700000000));

    core_t::TTime now{core::CTimeUtils::now()};
    core_t::TTime parsed{0};
    BOOST_REQUIRE(core::CTimeUtils::fromString(core::CTimeUtils::toIso8601(now), parsed));
    BOOST_REQUIRE_EQUAL(now, parsed);
    BOOST_TEST_REQUIRE(core::CTimeUtils::nowMs() / 1000 >= now);
}

BOOST_AUTO_TEST_CASE(testFromString) {
    core_t::TTime t{0};

    BOOST_REQUIRE(core::CTimeUtils::fromString("1700000000", t));
    BOOST_REQUIRE_EQUAL(1700000000, t);
    BOOST_REQUIRE(core::CTimeUtils::fromString("-60", t));
    BOOST_REQUIRE_EQUAL(-60, t);
    BOOST_REQUIRE(core::CTimeUtils::fromString("2023-11-14T22:13:20Z", t));
    BOOST_REQUIRE_EQUAL(1700000000, t);
    BOOST_REQUIRE(core::CTimeUtils::fromString("2023-11-14T22:13:20.750Z", t));
    BOOST_REQUIRE_EQUAL(1700000000, t);
    BOOST_REQUIRE(core::CTimeUtils::fromString("2023-11-14 22:14:20", t));
    BOOST_REQUIRE_EQUAL(1700000060, t);

    t = 5;
    BOOST_REQUIRE(core::CTimeUtils::fromString("", t) == false);
    BOOST_REQUIRE(core::CTimeUtils::fromString("99999999999999999999", t) == false);
    BOOST_REQUIRE(core::CTimeUtils::fromString("2023-13-45T00:00:00Z", t) == false);
    BOOST_REQUIRE_EQUAL(5, t);
}

BOOST_AUTO_TEST_CASE(testIntervals) {
    BOOST_REQUIRE_EQUAL(120, core::CTimeUtils::floorToInterval(150, 60));
    BOOST_REQUIRE_EQUAL(120, core::CTimeUtils::floorToInterval(120, 60));
    BOOST_REQUIRE_EQUAL(-60, core::CTimeUtils::floorToInterval(-1, 60));
    BOOST_REQUIRE_EQUAL(150, core::CTimeUtils::floorToInterval(150, 0));
    BOOST_REQUIRE_EQUAL(180, core::CTimeUtils::ceilToInterval(150, 60));
    BOOST_REQUIRE_EQUAL(120, core::CTimeUtils::ceilToInterval(120, 60));
    BOOST_REQUIRE_EQUAL(0, core::CTimeUtils::ceilToInterval(-1, 60));
}

BOOST_AUTO_TEST_SUITE_END()
