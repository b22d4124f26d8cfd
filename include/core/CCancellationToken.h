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
#ifndef INCLUDED_tsse_core_CCancellationToken_h
#define INCLUDED_tsse_core_CCancellationToken_h

#include <atomic>
#include <memory>
#include <stdexcept>

namespace tsse {
namespace core {

//! \brief Thrown from long running loops once cancellation is observed.
class CCanceledException : public std::runtime_error {
public:
    CCanceledException();
};

//! \brief A cooperative cancellation flag.
//!
//! DESCRIPTION:\n
//! Copies share the same flag, so the engine keeps one copy to cancel a
//! job and the job's computation checks another.  Loops check the flag at
//! natural boundaries (per candidate, per lag, every N windows) and unwind
//! with CCanceledException, which discards any partial work.
class CCancellationToken {
public:
    CCancellationToken();

    //! Request cancellation.  This is idempotent.
    void cancel();

    //! Check if cancellation has been requested.
    bool isCanceled() const;

    //! Throw CCanceledException if cancellation has been requested.
    void throwIfCanceled() const;

    //! Check every \p every iterations, i.e. when \p iteration is a multiple
    //! of \p every.
    void throwIfCanceled(std::size_t iteration, std::size_t every) const;

private:
    using TAtomicBoolPtr = std::shared_ptr<std::atomic_bool>;

private:
    TAtomicBoolPtr m_Canceled;
};
}
}

#endif // INCLUDED_tsse_core_CCancellationToken_h
