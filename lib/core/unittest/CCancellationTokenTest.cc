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

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <thread>

BOOST_AUTO_TEST_SUITE(CCancellationTokenTest)

using namespace tsse;

BOOST_AUTO_TEST_CASE(testCopiesShareFlag) {
    core::CCancellationToken token;
    core::CCancellationToken copy{token};

    BOOST_REQUIRE(copy.isCanceled() == false);
    BOOST_REQUIRE_NO_THROW(copy.throwIfCanceled());

    token.cancel();
    token.cancel();
    BOOST_REQUIRE(token.isCanceled());
    BOOST_REQUIRE(copy.isCanceled());
    BOOST_REQUIRE_THROW(copy.throwIfCanceled(), core::CCanceledException);

    core::CCancellationToken other;
    BOOST_REQUIRE(other.isCanceled() == false);
}

BOOST_AUTO_TEST_CASE(testPeriodicCheck) {
    core::CCancellationToken token;
    token.cancel();

    BOOST_REQUIRE_NO_THROW(token.throwIfCanceled(3, 8));
    BOOST_REQUIRE_THROW(token.throwIfCanceled(16, 8), core::CCanceledException);
    BOOST_REQUIRE_THROW(token.throwIfCanceled(5, 0), core::CCanceledException);
}

BOOST_AUTO_TEST_CASE(testCancelFromAnotherThread) {
    core::CCancellationToken token;
    std::atomic_size_t iterations{0};
    std::thread worker{[copy = token, &iterations] {
        try {
            for (std::size_t i = 0; true; ++i) {
                copy.throwIfCanceled(i, 16);
                ++iterations;
                std::this_thread::yield();
            }
        } catch (const core::CCanceledException&) {
        }
    }};
    while (iterations.load() < 100) {
        std::this_thread::yield();
    }
    token.cancel();
    worker.join();
    BOOST_TEST_REQUIRE(iterations.load() >= 100);
}

BOOST_AUTO_TEST_SUITE_END()
