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
#ifndef INCLUDED_tsse_maths_CTools_h
#define INCLUDED_tsse_maths_CTools_h

#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>

namespace tsse {
namespace maths {

//! \brief A collection of utility functions used throughout maths.
//!
//! DESCRIPTION:\n
//! Wrappers around boost::math distribution functions which never throw
//! and handle arguments at or beyond the edge of the support.  Any domain
//! problem is logged and a sensible limiting value returned.
class CTools {
public:
    using normal = boost::math::normal_distribution<double>;
    using students_t = boost::math::students_t_distribution<double>;

public:
    CTools() = delete;

    //! Compute the survival function 1 - F(x) of \p normal_.
    static double safeCdfComplement(const normal& normal_, double x);

    //! Compute the c.d.f. of \p students at \p x.
    static double safeCdf(const students_t& students, double x);

    //! Compute the quantile of \p normal_ for probability \p p in (0, 1).
    static double safeQuantile(const normal& normal_, double p);

    //! Truncate \p x to the range [\p a, \p b].
    static double truncate(double x, double a, double b) {
        return x < a ? a : (x > b ? b : x);
    }

    //! Is \p x finite, i.e. neither NaN nor infinite?
    static bool isFinite(double x);
};
}
}

#endif // INCLUDED_tsse_maths_CTools_h
