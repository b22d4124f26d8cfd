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
#include <analytics/CSampleStore.h>
#include <analytics/CSensorRegistry.h>

#include <api/CDatasetJsonReader.h>

#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>

BOOST_AUTO_TEST_SUITE(CDatasetJsonReaderTest)

using namespace tsse;

BOOST_AUTO_TEST_CASE(testRead) {
    std::istringstream input{R"({
        "sensors": [
            {"id": "v0", "name": "Voltage 0", "type": "voltage", "unit": "V",
             "node_id": "n1", "interval_seconds": 60},
            {"id": " v1 ", "source": "forecast_points", "is_public_provider": true},
            {"id": "d1", "derived": {"offset": 1.5,
                                     "inputs": [{"sensor_id": "v0", "coefficient": 2,
                                                 "lag_seconds": 60}]}}
        ],
        "samples": {
            "v0": [[1700000060, 2.0], ["2023-11-14T22:13:20Z", 1.0, "good"], [1700000120, 9.0, "bad"]]
        }
    })"};

    analytics::CSensorRegistry registry;
    analytics::CInMemorySampleStore store;
    api::CDatasetJsonReader reader{registry, store};
    std::string error;
    BOOST_REQUIRE_MESSAGE(reader.read(input, error), error);

    BOOST_REQUIRE_EQUAL(3, registry.size());
    const analytics::SSensorInfo* v0{registry.sensor("v0")};
    BOOST_REQUIRE(v0 != nullptr);
    BOOST_REQUIRE_EQUAL("Voltage 0", v0->s_Name);
    BOOST_REQUIRE_EQUAL("V", v0->s_Unit);
    BOOST_REQUIRE_EQUAL(60, v0->s_IntervalSeconds);
    BOOST_REQUIRE_EQUAL(analytics::SSensorInfo::E_Local, v0->s_Source);
    BOOST_REQUIRE(v0->isDerived() == false);

    const analytics::SSensorInfo* v1{registry.sensor("v1")};
    BOOST_REQUIRE(v1 != nullptr);
    BOOST_REQUIRE_EQUAL("v1", v1->s_Name);
    BOOST_REQUIRE_EQUAL(analytics::SSensorInfo::E_ForecastPoints, v1->s_Source);
    BOOST_REQUIRE(v1->s_IsPublicProvider);

    const analytics::SSensorInfo* d1{registry.sensor("d1")};
    BOOST_REQUIRE(d1 != nullptr);
    BOOST_REQUIRE(d1->isDerived());
    BOOST_REQUIRE_EQUAL(1.5, d1->s_Derived->s_Offset);
    BOOST_REQUIRE_EQUAL(1, d1->s_Derived->s_Inputs.size());
    BOOST_REQUIRE_EQUAL("v0", d1->s_Derived->s_Inputs[0].s_SensorId);
    BOOST_REQUIRE_EQUAL(2.0, d1->s_Derived->s_Inputs[0].s_Coefficient);
    BOOST_REQUIRE_EQUAL(60, d1->s_Derived->s_Inputs[0].s_LagSeconds);

    BOOST_REQUIRE_EQUAL(3, store.numberSamples("v0"));
    analytics::TSampleVec samples;
    BOOST_REQUIRE(store.readSamples("v0", 1700000000, 1700000180, samples));
    BOOST_REQUIRE_EQUAL(3, samples.size());
    BOOST_REQUIRE_EQUAL(1700000000, samples[0].s_Time);
    BOOST_REQUIRE_EQUAL(1.0, samples[0].s_Value);
    BOOST_REQUIRE_EQUAL(analytics_t::E_Bad, samples[2].s_Quality);
}

BOOST_AUTO_TEST_CASE(testErrors) {
    analytics::CSensorRegistry registry;
    analytics::CInMemorySampleStore store;
    api::CDatasetJsonReader reader{registry, store};
    std::string error;

    std::istringstream notJson{"{\"sensors\": ["};
    BOOST_REQUIRE(reader.read(notJson, error) == false);
    BOOST_TEST_REQUIRE(error.find("Failed to parse dataset") != std::string::npos);

    std::istringstream bad{R"({
        "sensors": [{"id": "v0", "source": "satellite"}, {"name": "no id"}],
        "samples": {"v0": [[1700000000], [1700000060, "x"]], "v9": []}
    })"};
    BOOST_REQUIRE(reader.read(bad, error) == false);
    BOOST_TEST_REQUIRE(error.find("'source'") != std::string::npos);
    BOOST_TEST_REQUIRE(error.find("missing required parameter 'id'") != std::string::npos);
    BOOST_TEST_REQUIRE(error.find("bad sample [1700000000]") != std::string::npos);
    BOOST_TEST_REQUIRE(error.find("unknown sensor 'v9'") != std::string::npos);

    // Nothing is loaded from an invalid document.
    BOOST_REQUIRE_EQUAL(0, registry.size());
    BOOST_REQUIRE_EQUAL(0, store.numberSamples("v0"));
}

BOOST_AUTO_TEST_SUITE_END()
