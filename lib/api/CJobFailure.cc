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
#include <api/CJobFailure.h>

namespace tsse {
namespace api {

const std::string CJobFailure::INVALID_PARAMS{"invalid_params"};
const std::string CJobFailure::NO_DATA{"no_data"};
const std::string CJobFailure::INTERNAL_ERROR{"internal_error"};
const std::string CJobFailure::RESULT_ENCODE_FAILED{"result_encode_failed"};

CJobFailure::CJobFailure(std::string code, const std::string& message)
    : std::runtime_error{message}, m_Code{std::move(code)} {
}

const std::string& CJobFailure::code() const {
    return m_Code;
}
}
}
