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
#include <core/CCancellationToken.h>

namespace tsse {
namespace core {

CCanceledException::CCanceledException()
    : std::runtime_error{"operation canceled"} {
}

CCancellationToken::CCancellationToken()
    : m_Canceled{std::make_shared<std::atomic_bool>(false)} {
}

void CCancellationToken::cancel() {
    m_Canceled->store(true, std::memory_order_release);
}

bool CCancellationToken::isCanceled() const {
    return m_Canceled->load(std::memory_order_acquire);
}

void CCancellationToken::throwIfCanceled() const {
    if (this->isCanceled()) {
        throw CCanceledException{};
    }
}

void CCancellationToken::throwIfCanceled(std::size_t iteration, std::size_t every) const {
    if (every == 0 || iteration % every == 0) {
        this->throwIfCanceled();
    }
}
}
}
