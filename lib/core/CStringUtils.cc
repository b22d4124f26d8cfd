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
#include <core/CStringUtils.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <algorithm>

namespace tsse {
namespace core {

void CStringUtils::trimWhitespace(std::string& str) {
    boost::algorithm::trim(str);
}

std::string CStringUtils::toLower(std::string str) {
    boost::algorithm::to_lower(str);
    return str;
}

bool CStringUtils::containsAny(const std::string& str, const TStrVec& keywords) {
    std::string lower{toLower(str)};
    return std::any_of(keywords.begin(), keywords.end(), [&lower](const std::string& keyword) {
        return lower.find(keyword) != std::string::npos;
    });
}

CStringUtils::TStrVec CStringUtils::normaliseIds(const TStrVec& ids) {
    TStrVec result;
    result.reserve(ids.size());
    for (auto id : ids) {
        trimWhitespace(id);
        if (id.empty() == false) {
            result.push_back(std::move(id));
        }
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}
}
}
