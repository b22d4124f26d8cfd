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
#ifndef INCLUDED_tsse_analytics_CSeriesEmbedding_h
#define INCLUDED_tsse_analytics_CSeriesEmbedding_h

#include <analytics/AnalyticsTypes.h>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tsse {
namespace analytics {

//! \brief A fixed length distribution feature vector of a series.
//!
//! DESCRIPTION:\n
//! The features are robust location, scale and tail statistics of the
//! values and of the per second differences, plus spike rates of both.
//! Vectors are L2 normalised so cosine similarity is a dot product.
//!
//! This describes the level and shape of the value distribution only.  It
//! carries no information about when things happen, so two sensors whose
//! changes align perfectly in time can have dissimilar embeddings and vice
//! versa.  Use it to shortlist candidates cheaply, never as evidence of a
//! temporal relationship.
class CSeriesEmbedding {
public:
    using TOptionalDoubleVec = std::optional<TDoubleVec>;
    using TStrDoublePr = std::pair<std::string, double>;
    using TStrDoublePrVec = std::vector<TStrDoublePr>;
    using TStrDoubleVecPr = std::pair<std::string, TDoubleVec>;
    using TStrDoubleVecPrVec = std::vector<TStrDoubleVecPr>;

public:
    static constexpr std::size_t NUMBER_ROBUST_FEATURES{10};
    static constexpr std::size_t NUMBER_SPIKE_FEATURES{4};
    static constexpr std::size_t DIMENSION{2 * (NUMBER_ROBUST_FEATURES + NUMBER_SPIKE_FEATURES)};
    static constexpr double Z_CLIP{6.0};
    static constexpr double SPIKE_Z{2.5};
    static constexpr double HIGH_SPIKE_Z{SPIKE_Z + 1.5};

public:
    CSeriesEmbedding() = delete;

    //! Compute the embedding of \p series or none if it has fewer than
    //! three values.
    static TOptionalDoubleVec compute(const SSeries& series);

    //! The cosine similarity of \p lhs and \p rhs.
    static double cosineSimilarity(const TDoubleVec& lhs, const TDoubleVec& rhs);

    //! The \p k candidates most similar to \p focus, most similar first with
    //! ties broken by id.
    static TStrDoublePrVec shortlist(const TDoubleVec& focus,
                                     const TStrDoubleVecPrVec& candidates,
                                     std::size_t k);

private:
    static TDoubleVec robustFeatures(const TDoubleVec& values);
    static TDoubleVec spikeFeatures(const TDoubleVec& values);
};
}
}

#endif // INCLUDED_tsse_analytics_CSeriesEmbedding_h
