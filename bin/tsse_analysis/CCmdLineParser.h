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
#ifndef INCLUDED_tsse_analysis_CCmdLineParser_h
#define INCLUDED_tsse_analysis_CCmdLineParser_h

#include <cstddef>
#include <cstdint>
#include <string>

namespace tsse {
namespace analysis {

//! \brief
//! Very simple command line parser.
//!
//! DESCRIPTION:\n
//! Very simple command line parser.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Put in a class rather than main to allow testing.
//!
class CCmdLineParser {
public:
    //! Parse the arguments and return options if appropriate.
    static bool parse(int argc,
                      const char* const* argv,
                      std::string& logProperties,
                      std::string& datasetFileName,
                      std::string& requestFileName,
                      std::string& outputFileName,
                      std::size_t& threads,
                      std::size_t& maxConcurrentJobs,
                      std::uint64_t& timeoutMs);

private:
    static const std::string DESCRIPTION;
};
}
}

#endif // INCLUDED_tsse_analysis_CCmdLineParser_h
