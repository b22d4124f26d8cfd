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
#ifndef INCLUDED_tsse_core_t_CoreTypes_h
#define INCLUDED_tsse_core_t_CoreTypes_h

#include <cstdint>

namespace tsse {
namespace core_t {

//! Seconds since the epoch, UTC.  Bucket starts, window bounds and lags
//! are all expressed in this unit.
using TTime = std::int64_t;

//! Milliseconds, used for timings and compute budgets.
using TMilliseconds = std::uint64_t;
}
}

#endif // INCLUDED_tsse_core_t_CoreTypes_h
