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
#ifndef INCLUDED_tsse_api_CJobFailure_h
#define INCLUDED_tsse_api_CJobFailure_h

#include <stdexcept>
#include <string>

namespace tsse {
namespace api {

//! \brief Thrown from inside a running job when it can't produce a result.
//!
//! DESCRIPTION:\n
//! Carries a stable machine readable code, one of the constants below, and
//! a message for people.  The engine records both on the failed job.
class CJobFailure : public std::runtime_error {
public:
    static const std::string INVALID_PARAMS;
    static const std::string NO_DATA;
    static const std::string INTERNAL_ERROR;
    static const std::string RESULT_ENCODE_FAILED;

public:
    CJobFailure(std::string code, const std::string& message);

    const std::string& code() const;

private:
    std::string m_Code;
};
}
}

#endif // INCLUDED_tsse_api_CJobFailure_h
