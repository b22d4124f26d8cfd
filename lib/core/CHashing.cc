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
#include <core/CHashing.h>

#include <boost/config.hpp>

namespace tsse {
namespace core {

std::uint64_t CHashing::safeMurmurHash64(const void* key, int length, std::uint64_t seed) {
    constexpr std::uint64_t m = 0xc6a4a7935bd1e995ULL;
    constexpr int r = 47;

    std::uint64_t h = seed ^ (static_cast<std::uint64_t>(length) * m);

    const auto* data = static_cast<const unsigned char*>(key);

    while (length >= 8) {
        std::uint64_t k{0};
        for (int i = 7; i >= 0; --i) {
            k = (k << 8) | std::uint64_t(data[i]);
        }

        k *= m;
        k ^= k >> r;
        k *= m;

        h ^= k;
        h *= m;

        data += 8;
        length -= 8;
    }

    switch (length) {
    case 7:
        h ^= std::uint64_t(data[6]) << 48;
        BOOST_FALLTHROUGH;
    case 6:
        h ^= std::uint64_t(data[5]) << 40;
        BOOST_FALLTHROUGH;
    case 5:
        h ^= std::uint64_t(data[4]) << 32;
        BOOST_FALLTHROUGH;
    case 4:
        h ^= std::uint64_t(data[3]) << 24;
        BOOST_FALLTHROUGH;
    case 3:
        h ^= std::uint64_t(data[2]) << 16;
        BOOST_FALLTHROUGH;
    case 2:
        h ^= std::uint64_t(data[1]) << 8;
        BOOST_FALLTHROUGH;
    case 1:
        h ^= std::uint64_t(data[0]);
        h *= m;
        BOOST_FALLTHROUGH;
    default:
        break;
    }

    h ^= h >> r;
    h *= m;
    h ^= h >> r;

    return h;
}

std::uint64_t CHashing::hashString(const std::string& key, std::uint64_t seed) {
    return safeMurmurHash64(key.data(), static_cast<int>(key.size()), seed);
}

std::uint64_t CHashing::hashCombine(std::uint64_t seed, std::uint64_t h) {
    // C = 2^64 / golden ratio, as used by boost::hash_combine
    constexpr std::uint64_t C = 0x9e3779b97f4A7c15ULL;
    seed ^= h + C + (seed << 6) + (seed >> 2);
    return seed;
}
}
}
