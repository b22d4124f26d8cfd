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
#include <maths/CCorrelation.h>

#include <core/CLogger.h>

#include <maths/CRobustStatistics.h>
#include <maths/CTools.h>

#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <numeric>

namespace tsse {
namespace maths {
namespace {
//! Collect the finite pairs of \p a and \p b aligned at \p lagSeconds.
template<typename VISITOR>
void visitAligned(const CCorrelation::TTimeDoublePrVec& a,
                  const CCorrelation::TTimeDoublePrVec& b,
                  core_t::TTime lagSeconds,
                  VISITOR visitor) {
    std::size_t i{0};
    std::size_t j{0};
    while (i < a.size() && j < b.size()) {
        core_t::TTime ta{a[i].first};
        core_t::TTime tb{b[j].first - lagSeconds};
        if (ta == tb) {
            if (std::isfinite(a[i].second) && std::isfinite(b[j].second)) {
                visitor(a[i].second, b[j].second);
            }
            ++i;
            ++j;
        } else if (ta < tb) {
            ++i;
        } else {
            ++j;
        }
    }
}

double fisherZ(double r) {
    r = CTools::truncate(r, -CCorrelation::MAX_ABS_R, CCorrelation::MAX_ABS_R);
    return 0.5 * std::log((1.0 + r) / (1.0 - r));
}
}

void CCorrelation::CPearsonAccumulator::add(double x, double y) {
    if (std::isfinite(x) == false || std::isfinite(y) == false) {
        return;
    }
    ++m_N;
    m_SumX += x;
    m_SumY += y;
    m_SumXX += x * x;
    m_SumYY += y * y;
    m_SumXY += x * y;
}

CCorrelation::TOptionalDouble CCorrelation::CPearsonAccumulator::correlation() const {
    if (m_N < 2) {
        return std::nullopt;
    }
    double n{static_cast<double>(m_N)};
    double denomX{n * m_SumXX - m_SumX * m_SumX};
    double denomY{n * m_SumYY - m_SumY * m_SumY};
    double denom{std::sqrt(denomX * denomY)};
    if (std::isfinite(denom) == false || denomX <= 0.0 || denomY <= 0.0 || denom <= 0.0) {
        return std::nullopt;
    }
    double r{(n * m_SumXY - m_SumX * m_SumY) / denom};
    return CTools::truncate(r, -1.0, 1.0);
}

CCorrelation::TOptionalDouble CCorrelation::pearson(const TDoubleVec& x, const TDoubleVec& y) {
    if (x.size() != y.size()) {
        LOG_ERROR(<< "Mismatched lengths " << x.size() << " and " << y.size());
        return std::nullopt;
    }
    CPearsonAccumulator accumulator;
    for (std::size_t i = 0; i < x.size(); ++i) {
        accumulator.add(x[i], y[i]);
    }
    return accumulator.correlation();
}

CCorrelation::TOptionalDouble CCorrelation::spearman(const TDoubleVec& x, const TDoubleVec& y) {
    if (x.size() != y.size()) {
        LOG_ERROR(<< "Mismatched lengths " << x.size() << " and " << y.size());
        return std::nullopt;
    }
    TDoubleVec xs;
    TDoubleVec ys;
    xs.reserve(x.size());
    ys.reserve(y.size());
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (std::isfinite(x[i]) && std::isfinite(y[i])) {
            xs.push_back(x[i]);
            ys.push_back(y[i]);
        }
    }
    return pearson(CRobustStatistics::averageRanks(xs), CRobustStatistics::averageRanks(ys));
}

CCorrelation::SLaggedCorrelation CCorrelation::atLag(const TTimeDoublePrVec& a,
                                                     const TTimeDoublePrVec& b,
                                                     core_t::TTime lagSeconds,
                                                     EMethod method,
                                                     std::size_t minOverlap) {
    SLaggedCorrelation result;
    result.s_LagSeconds = lagSeconds;

    switch (method) {
    case E_Pearson: {
        CPearsonAccumulator accumulator;
        visitAligned(a, b, lagSeconds,
                     [&accumulator](double x, double y) { accumulator.add(x, y); });
        result.s_N = accumulator.count();
        if (result.s_N >= minOverlap) {
            result.s_R = accumulator.correlation();
        }
        break;
    }
    case E_Spearman: {
        TDoubleVec xs;
        TDoubleVec ys;
        visitAligned(a, b, lagSeconds, [&xs, &ys](double x, double y) {
            xs.push_back(x);
            ys.push_back(y);
        });
        result.s_N = xs.size();
        if (result.s_N >= minOverlap) {
            result.s_R = pearson(CRobustStatistics::averageRanks(xs),
                                 CRobustStatistics::averageRanks(ys));
        }
        break;
    }
    }
    return result;
}

CCorrelation::SLaggedCorrelation CCorrelation::bestWithinLag(const TTimeDoublePrVec& a,
                                                             const TTimeDoublePrVec& b,
                                                             EMethod method,
                                                             std::size_t minOverlap,
                                                             core_t::TTime interval,
                                                             std::size_t maxLagBuckets) {
    interval = std::max(interval, core_t::TTime{1});
    auto maxLag = static_cast<core_t::TTime>(maxLagBuckets);

    SLaggedCorrelation best;
    for (core_t::TTime lagBuckets = -maxLag; lagBuckets <= maxLag; ++lagBuckets) {
        core_t::TTime lag{lagBuckets * interval};
        SLaggedCorrelation candidate{atLag(a, b, lag, method, minOverlap)};
        if (candidate.s_R == std::nullopt) {
            continue;
        }
        if (best.s_R == std::nullopt) {
            best = candidate;
            continue;
        }
        double abs{std::fabs(*candidate.s_R)};
        double bestAbs{std::fabs(*best.s_R)};
        bool replace{abs > bestAbs ||
                     (abs == bestAbs && candidate.s_N > best.s_N) ||
                     (abs == bestAbs && candidate.s_N == best.s_N &&
                      std::abs(lag) < std::abs(best.s_LagSeconds)) ||
                     (abs == bestAbs && candidate.s_N == best.s_N &&
                      std::abs(lag) == std::abs(best.s_LagSeconds) &&
                      lag < best.s_LagSeconds)};
        if (replace) {
            best = candidate;
        }
    }
    return best;
}

CCorrelation::TOptionalDouble CCorrelation::lag1Autocorrelation(const TDoubleVec& values) {
    if (values.size() < 3) {
        return std::nullopt;
    }
    CPearsonAccumulator accumulator;
    for (std::size_t i = 1; i < values.size(); ++i) {
        accumulator.add(values[i - 1], values[i]);
    }
    if (accumulator.count() < 3) {
        return std::nullopt;
    }
    auto r = accumulator.correlation();
    if (r == std::nullopt) {
        return std::nullopt;
    }
    return CTools::truncate(*r, -MAX_ABS_R, MAX_ABS_R);
}

std::size_t CCorrelation::effectiveSampleSize(std::size_t n,
                                              const TOptionalDouble& rhoX,
                                              const TOptionalDouble& rhoY) {
    if (n < 3 || rhoX == std::nullopt || rhoY == std::nullopt ||
        std::isfinite(*rhoX) == false || std::isfinite(*rhoY) == false) {
        return n;
    }
    // Negative products would credit more than n samples.
    double denom{std::max(1.0 + 2.0 * *rhoX * *rhoY, 1.0)};
    auto nEff = static_cast<std::size_t>(std::floor(static_cast<double>(n) / denom));
    return std::max(std::size_t{3}, std::min(nEff, n));
}

CCorrelation::TOptionalDouble CCorrelation::pearsonPValue(double r, std::size_t n) {
    if (n < 4 || std::isfinite(r) == false) {
        return std::nullopt;
    }
    r = CTools::truncate(r, -MAX_ABS_R, MAX_ABS_R);
    if (std::fabs(r) >= 0.999999) {
        return std::numeric_limits<double>::min();
    }
    double se{1.0 / std::sqrt(static_cast<double>(n) - 3.0)};
    double z{std::fabs(fisherZ(r) / se)};
    double p{2.0 * CTools::safeCdfComplement(boost::math::normal_distribution<>{0.0, 1.0}, z)};
    return CTools::truncate(p, std::numeric_limits<double>::min(), 1.0);
}

CCorrelation::TOptionalDouble CCorrelation::spearmanPValue(double r, std::size_t n) {
    if (n < 4 || std::isfinite(r) == false) {
        return std::nullopt;
    }
    r = CTools::truncate(r, -MAX_ABS_R, MAX_ABS_R);
    double df{static_cast<double>(n) - 2.0};
    double t{r * std::sqrt(df / std::max(1.0 - r * r, 1e-12))};
    double p{2.0 * (1.0 - CTools::safeCdf(boost::math::students_t_distribution<>{df},
                                          std::fabs(t)))};
    return CTools::truncate(p, 0.0, 1.0);
}

CCorrelation::TOptionalDouble CCorrelation::pValue(double r, std::size_t n, EMethod method) {
    switch (method) {
    case E_Pearson:
        return pearsonPValue(r, n);
    case E_Spearman:
        return spearmanPValue(r, n);
    }
    return std::nullopt;
}

CCorrelation::TOptionalDoubleDoublePr
CCorrelation::fisherZInterval(double r, std::size_t n, double zValue) {
    if (n < 4 || std::isfinite(r) == false || std::isfinite(zValue) == false) {
        return std::nullopt;
    }
    double z{fisherZ(r)};
    double se{1.0 / std::sqrt(static_cast<double>(n) - 3.0)};
    double low{std::tanh(z - zValue * se)};
    double high{std::tanh(z + zValue * se)};
    return TDoubleDoublePr{CTools::truncate(low, -1.0, 1.0), CTools::truncate(high, -1.0, 1.0)};
}

CCorrelation::TOptionalDouble CCorrelation::zValueForAlpha(double alpha) {
    if ((alpha > 0.0 && alpha < 1.0) == false) {
        return std::nullopt;
    }
    return CTools::safeQuantile(boost::math::normal_distribution<>{0.0, 1.0}, 1.0 - alpha / 2.0);
}

CCorrelation::TDoubleVec CCorrelation::benjaminiHochberg(const TDoubleVec& pValues) {
    std::size_t m{pValues.size()};
    TDoubleVec qValues(m, 1.0);
    if (m == 0) {
        return qValues;
    }

    std::vector<std::size_t> order(m);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&pValues](std::size_t lhs, std::size_t rhs) {
        return pValues[lhs] < pValues[rhs];
    });

    // Step-up: q_(i) = min_{k >= i} p_(k) m / k.
    double runningMin{1.0};
    for (std::size_t rank = m; rank > 0; --rank) {
        std::size_t index{order[rank - 1]};
        double q{pValues[index] * static_cast<double>(m) / static_cast<double>(rank)};
        runningMin = std::min(runningMin, q);
        qValues[index] = CTools::truncate(runningMin, 0.0, 1.0);
    }
    return qValues;
}

bool CCorrelation::isSignificant(double qValue, double r, double alpha, double minAbsR) {
    return qValue <= alpha && std::fabs(r) >= minAbsR;
}
}
}
