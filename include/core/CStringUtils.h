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
#ifndef INCLUDED_tsse_core_CStringUtils_h
#define INCLUDED_tsse_core_CStringUtils_h

#include <string>
#include <vector>

namespace tsse {
namespace core {

//! \brief
//! A holder of string utility methods.
//!
class CStringUtils {
public:
    using TStrVec = std::vector<std::string>;

public:
    CStringUtils() = delete;

    //! Trim whitespace from both ends of a string in place.
    static void trimWhitespace(std::string& str);

    //! Convert to lower case.
    static std::string toLower(std::string str);

    //! Does \p str contain any of \p keywords?  Comparison is case
    //! insensitive.
    static bool containsAny(const std::string& str, const TStrVec& keywords);

    //! Trim each id, drop empty ones, then sort and remove duplicates.
    static TStrVec normaliseIds(const TStrVec& ids);
};
}
}

#endif // INCLUDED_tsse_core_CStringUtils_h
