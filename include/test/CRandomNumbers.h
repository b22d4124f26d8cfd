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
#ifndef INCLUDED_tsse_test_CRandomNumbers_h
#define INCLUDED_tsse_test_CRandomNumbers_h

#include <boost/random/mersenne_twister.hpp>

#include <algorithm>
#include <cstddef>
#include <vector>

namespace tsse {
namespace test {

//! \brief Creates random numbers from a variety of distributions.
//!
//! DESCRIPTION:\n
//! The generator has a fixed seed so synthetic telemetry built from it
//! is the same on every run and every platform.
class CRandomNumbers {
public:
    using TDoubleVec = std::vector<double>;
    using TDoubleVecVec = std::vector<TDoubleVec>;
    using TUIntVec = std::vector<unsigned int>;
    using TSizeVec = std::vector<std::size_t>;
    using TGenerator = boost::random::mt19937_64;

public:
    //! \brief Generate random samples from the specified distribution
    //! using a custom random number generator.
    template<typename RNG, typename Distribution, typename Container>
    static void generateSamples(RNG& randomNumberGenerator,
                                Distribution& distribution,
                                std::size_t numberSamples,
                                Container& samples) {
        samples.clear();
        samples.reserve(numberSamples);
        for (std::size_t i = 0; i < numberSamples; ++i) {
            samples.push_back(distribution(randomNumberGenerator));
        }
    }

    //! Shuffle the elements of a sequence using the internal random number
    //! generator, independently of the standard library implementation.
    template<typename ITR>
    void random_shuffle(ITR first, ITR last) {
        auto d = last - first;
        if (d > 1) {
            for (--last; first < last; ++first, --d) {
                TSizeVec i;
                this->generateUniformSamples(0, static_cast<std::size_t>(d), 1, i);
                if (i[0] != 0) {
                    std::iter_swap(first, first + static_cast<std::ptrdiff_t>(i[0]));
                }
            }
        }
    }

    //! Generate normal random samples with the specified mean and
    //! variance using the default random number generator.
    void generateNormalSamples(double mean,
                               double variance,
                               std::size_t numberSamples,
                               TDoubleVec& samples);

    //! Generate multivariate normal random samples with the specified
    //! mean and covariance matrix using the default random number generator.
    void generateMultivariateNormalSamples(const TDoubleVec& mean,
                                           const TDoubleVecVec& covariances,
                                           std::size_t numberSamples,
                                           TDoubleVecVec& samples);

    //! Generate Poisson random samples with the specified rate using
    //! the default random number generator.
    void generatePoissonSamples(double rate, std::size_t numberSamples, TUIntVec& samples);

    //! Generate uniform random samples in the interval [a,b) using
    //! the default random number generator.
    void generateUniformSamples(double a, double b, std::size_t numberSamples, TDoubleVec& samples);

    //! Generate uniform integer samples from the the set [a, a+1, ..., b)
    //! using the default random number generator.
    void generateUniformSamples(std::size_t a, std::size_t b, std::size_t numberSamples, TSizeVec& samples);

    //! Throw away \p n random numbers.
    void discard(std::size_t n);

private:
    //! The random number generator.
    TGenerator m_Generator;
};
}
}

#endif // INCLUDED_tsse_test_CRandomNumbers_h
