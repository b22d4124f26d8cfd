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
#ifndef INCLUDED_tsse_api_CDatasetJsonReader_h
#define INCLUDED_tsse_api_CDatasetJsonReader_h

#include <core/CBoostJsonParser.h>

#include <iosfwd>
#include <string>

namespace tsse {
namespace analytics {
class CInMemorySampleStore;
class CSensorRegistry;
}
namespace api {

//! \brief Loads sensor metadata and raw samples from a JSON document.
//!
//! DESCRIPTION:\n
//! The document has the form
//! \code
//! {
//!   "sensors": [
//!     {"id": "v1", "name": "Voltage", "type": "voltage", "unit": "V",
//!      "node_id": "n1", "interval_seconds": 60, "source": "local",
//!      "is_public_provider": false,
//!      "derived": {"offset": 0.0,
//!                  "inputs": [{"sensor_id": "v0", "coefficient": 2.0,
//!                              "lag_seconds": 0}]}}
//!   ],
//!   "samples": {"v1": [[1700000000, 230.1], ["2023-11-14T22:14:20Z", 229.8, "bad"]]}
//! }
//! \endcode
//! Sample times are seconds since the epoch or ISO 8601 UTC strings and the
//! optional third element is the sample quality.
class CDatasetJsonReader {
public:
    CDatasetJsonReader(analytics::CSensorRegistry& registry,
                       analytics::CInMemorySampleStore& store);

    //! Read the document in \p input.
    bool read(std::istream& input, std::string& error);

    //! Read \p document.  Nothing is added if there are any errors.
    bool read(const json::value& document, std::string& error);

private:
    analytics::CSensorRegistry& m_Registry;
    analytics::CInMemorySampleStore& m_Store;
};
}
}

#endif // INCLUDED_tsse_api_CDatasetJsonReader_h
