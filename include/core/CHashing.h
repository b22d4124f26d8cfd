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
#ifndef INCLUDED_tsse_core_CHashing_h
#define INCLUDED_tsse_core_CHashing_h

#include <cstdint>
#include <string>

namespace tsse {
namespace core {

//! \brief Hashing functionality.
//!
//! DESCRIPTION:\n
//! Stable 64 bit hashes used wherever an ordering or identifier must be
//! reproducible between runs and machines, for example the candidate
//! order used when a sensor pool has to be truncated.
class CHashing {
public:
    CHashing() = delete;

    //! MurmurHash2: safe 64-bit hash.
    //!
    //! Adapted from Austin Appleby's neutral implementation of MurmurHash2
    //! (which is in the public domain). This is both alignment safe and
    //! endian neutral so hashed values can be relied on across platforms.
    static std::uint64_t safeMurmurHash64(const void* key, int length, std::uint64_t seed);

    //! Hash a string with safeMurmurHash64.
    static std::uint64_t hashString(const std::string& key, std::uint64_t seed = 0);

    //! 64 bit hash combine modeled on boost::hash_combine.
    static std::uint64_t hashCombine(std::uint64_t seed, std::uint64_t h);
};
}
}

#endif // INCLUDED_tsse_core_CHashing_h
