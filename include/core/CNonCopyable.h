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
#ifndef INCLUDED_tsse_core_CNonCopyable_h
#define INCLUDED_tsse_core_CNonCopyable_h

namespace tsse {
namespace core {

//! \brief
//! Equivalent to boost::noncopyable.
//!
//! DESCRIPTION:\n
//! Classes for which copying is not allowed should inherit privately
//! from this class.  Registries, loggers and anything holding a mutex
//! fall into this category.
//!
class CNonCopyable {
protected:
    CNonCopyable() = default;
    ~CNonCopyable() = default;

public:
    CNonCopyable(const CNonCopyable&) = delete;
    CNonCopyable& operator=(const CNonCopyable&) = delete;
};
}
}

#endif // INCLUDED_tsse_core_CNonCopyable_h
