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
#include <core/CBoostJsonParser.h>

#include <analytics/CSampleStore.h>
#include <analytics/CSensorRegistry.h>

#include <api/CAnalysisJobEngine.h>
#include <api/CJobFailure.h>

#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

BOOST_AUTO_TEST_SUITE(CAnalysisJobEngineTest)

using namespace tsse;

namespace {
using TEngine = api::CAnalysisJobEngine;

const core_t::TTime START{1700000000};
const core_t::TTime INTERVAL{60};
const std::uint64_t TIMEOUT_MS{30000};

class CFixture {
public:
    CFixture() {
        this->add("a", [](std::size_t i) { return std::sin(0.1 * static_cast<double>(i)); });
        this->add("b", [](std::size_t i) {
            return 2.0 * std::sin(0.1 * static_cast<double>(i)) + 1.0 +
                   0.01 * static_cast<double>(i % 3);
        });
        analytics::SSensorInfo empty;
        empty.s_Id = "empty";
        m_Registry.addSensor(empty);

        // Two sensors which share three pulses, the second one bucket later.
        test::CRandomNumbers rng;
        std::vector<double> noise;
        rng.generateNormalSamples(20.0, 0.01, 600, noise);
        auto pulses = [&noise](std::size_t offset, std::size_t lag) {
            return [&noise, offset, lag](std::size_t i) {
                double value{noise[offset + i]};
                for (std::size_t at : {50, 150, 250}) {
                    value += (i == at + lag ? 10.0 : 0.0) + (i == at + lag + 1 ? 5.0 : 0.0);
                }
                return value;
            };
        };
        this->add("spike_focus", pulses(0, 0));
        this->add("spike_follows", pulses(300, 1));
    }

    template<typename F>
    void add(const std::string& id, F value) {
        analytics::SSensorInfo info;
        info.s_Id = id;
        info.s_Type = "voltage";
        info.s_NodeId = "node";
        m_Registry.addSensor(info);
        for (std::size_t i = 0; i < 300; ++i) {
            m_Store.addSample(id, {START + static_cast<core_t::TTime>(i) * INTERVAL + 1, value(i)});
        }
    }

    TEngine::SConfig config(std::size_t maxConcurrentJobs = 2) const {
        TEngine::SConfig result;
        result.s_Threads = 2;
        result.s_MaxConcurrentJobs = maxConcurrentJobs;
        return result;
    }

protected:
    analytics::CSensorRegistry m_Registry;
    analytics::CInMemorySampleStore m_Store;
};

//! Holds every read until it is opened.
class CGatedSampleStore : public analytics::CSampleStore {
public:
    explicit CGatedSampleStore(const analytics::CSampleStore& delegate)
        : m_Delegate{delegate} {}

    bool readSamples(const std::string& sensorId,
                     core_t::TTime start,
                     core_t::TTime end,
                     analytics::TSampleVec& result) const override {
        {
            std::unique_lock<std::mutex> lock{m_Mutex};
            m_Reading = true;
            m_Condition.notify_all();
            m_Condition.wait_for(lock, std::chrono::milliseconds(TIMEOUT_MS),
                                 [this] { return m_Open; });
        }
        return m_Delegate.readSamples(sensorId, start, end, result);
    }

    //! Wait until a job is blocked reading samples.
    bool waitForRead() const {
        std::unique_lock<std::mutex> lock{m_Mutex};
        return m_Condition.wait_for(lock, std::chrono::milliseconds(TIMEOUT_MS),
                                    [this] { return m_Reading; });
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock{m_Mutex};
            m_Open = true;
        }
        m_Condition.notify_all();
    }

private:
    const analytics::CSampleStore& m_Delegate;
    mutable std::mutex m_Mutex;
    mutable std::condition_variable m_Condition;
    mutable bool m_Reading{false};
    bool m_Open{false};
};

TEngine::SCreateRequest request(const std::string& type,
                                const std::string& params,
                                const std::string& jobKey = "",
                                bool dedupe = false) {
    TEngine::SCreateRequest result;
    result.s_JobType = type;
    std::string error;
    BOOST_REQUIRE_MESSAGE(core::CBoostJsonParser::parse(params, result.s_Params, error), error);
    result.s_JobKey = jobKey;
    result.s_Dedupe = dedupe;
    return result;
}

api::SJob create(TEngine& engine, const TEngine::SCreateRequest& request) {
    bool created{false};
    api::SJobError error;
    auto job = engine.createJob(request, created, error);
    BOOST_REQUIRE_MESSAGE(job.has_value(), error.s_Message);
    BOOST_REQUIRE(created);
    return *job;
}

void waitForProgress(const TEngine& engine, const std::string& id) {
    for (std::size_t i = 0; i < 3000; ++i) {
        auto job = engine.job(id);
        BOOST_REQUIRE(job.has_value());
        if (job->s_Status == api_t::E_Running && job->s_Progress.s_Completed >= 1) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    BOOST_FAIL("Job " + id + " made no progress");
}
}

BOOST_FIXTURE_TEST_CASE(testNoopCompletes, CFixture) {
    TEngine engine{m_Registry, m_Store, this->config()};

    api::SJob job{create(engine, request("noop", R"({"steps": 5})"))};
    BOOST_REQUIRE_EQUAL("job-1", job.s_Id);
    BOOST_REQUIRE(engine.waitForTerminal(job.s_Id, TIMEOUT_MS));

    job = *engine.job(job.s_Id);
    BOOST_REQUIRE_EQUAL(api_t::E_Completed, job.s_Status);
    BOOST_REQUIRE(job.s_StartedAt.has_value());
    BOOST_REQUIRE(job.s_CompletedAt.has_value());
    BOOST_REQUIRE(job.s_Error.has_value() == false);
    BOOST_REQUIRE_EQUAL(5, job.s_Progress.s_Completed);
    BOOST_REQUIRE(job.s_Progress.s_Total.has_value());
    BOOST_REQUIRE_EQUAL(5, *job.s_Progress.s_Total);

    auto result = engine.result(job.s_Id);
    BOOST_REQUIRE(result.has_value());
    BOOST_REQUIRE_EQUAL(5, result->as_object().at("steps").as_uint64());

    api::TJobEventVec events{engine.events(job.s_Id, 0, 0)};
    BOOST_REQUIRE(events.size() >= 5);
    BOOST_REQUIRE_EQUAL("created", events.front().s_Kind);
    BOOST_REQUIRE_EQUAL("started", events[1].s_Kind);
    BOOST_REQUIRE_EQUAL("runner_summary", events.back().s_Kind);
    BOOST_REQUIRE_EQUAL("completed", events[events.size() - 2].s_Kind);
    BOOST_REQUIRE_EQUAL("completed",
                        std::string{events.back().s_Payload.at("status").as_string()});
    for (std::size_t i = 0; i < events.size(); ++i) {
        BOOST_REQUIRE_EQUAL(static_cast<std::int64_t>(i + 1), events[i].s_Id);
    }

    // Paging.
    api::TJobEventVec page{engine.events(job.s_Id, 1, 2)};
    BOOST_REQUIRE_EQUAL(2, page.size());
    BOOST_REQUIRE_EQUAL(2, page[0].s_Id);
    BOOST_REQUIRE_EQUAL(3, page[1].s_Id);
    BOOST_REQUIRE(engine.events(job.s_Id, events.back().s_Id, 10).empty());

    BOOST_REQUIRE(engine.job("job-100").has_value() == false);
    BOOST_REQUIRE(engine.result("job-100").has_value() == false);
    BOOST_REQUIRE(engine.waitForTerminal("job-100", 10) == false);
}

BOOST_FIXTURE_TEST_CASE(testInvalidRequests, CFixture) {
    TEngine engine{m_Registry, m_Store, this->config()};

    bool created{true};
    api::SJobError error;
    BOOST_REQUIRE(engine.createJob(request("forecast", "{}"), created, error).has_value() == false);
    BOOST_REQUIRE(created == false);
    BOOST_REQUIRE_EQUAL(api::CJobFailure::INVALID_PARAMS, error.s_Code);

    BOOST_REQUIRE(engine.createJob(request("matrix_profile", R"({"sensor_id": "a"})"),
                                   created, error)
                      .has_value() == false);
    BOOST_REQUIRE_EQUAL(api::CJobFailure::INVALID_PARAMS, error.s_Code);
    BOOST_TEST_REQUIRE(error.s_Message.find("start") != std::string::npos);

    // Unknown sensors are caught before a job is created.
    BOOST_REQUIRE(engine.createJob(request("event_match", R"({"focus_sensor_id": "missing",)"
                                                          R"( "start": 1700000000, "end": 1700018000})"),
                                   created, error)
                      .has_value() == false);
    BOOST_REQUIRE_EQUAL(api::CJobFailure::INVALID_PARAMS, error.s_Code);
    BOOST_TEST_REQUIRE(error.s_Message.find("missing") != std::string::npos);

    BOOST_REQUIRE_EQUAL(0, engine.numberJobs());
}

BOOST_FIXTURE_TEST_CASE(testDedupe, CFixture) {
    TEngine engine{m_Registry, m_Store, this->config()};

    const std::string params{R"({"steps": 2000, "step_ms": 5})"};
    api::SJob first{create(engine, request("noop", params, " key-1 ", true))};
    BOOST_REQUIRE_EQUAL("key-1", first.s_JobKey);

    bool created{true};
    api::SJobError error;
    auto second = engine.createJob(request("noop", params, "key-1", true), created, error);
    BOOST_REQUIRE(second.has_value());
    BOOST_REQUIRE(created == false);
    BOOST_REQUIRE_EQUAL(first.s_Id, second->s_Id);

    // Without dedupe or with a different key a new job is created.
    api::SJob third{create(engine, request("noop", params, "key-1", false))};
    BOOST_REQUIRE(third.s_Id != first.s_Id);
    api::SJob fourth{create(engine, request("noop", params, "key-2", true))};
    BOOST_REQUIRE(fourth.s_Id != first.s_Id);

    // Canceled jobs aren't reused.
    for (const auto& id : {first.s_Id, third.s_Id, fourth.s_Id}) {
        BOOST_REQUIRE(engine.requestCancel(id).has_value());
    }
    for (const auto& id : {first.s_Id, third.s_Id, fourth.s_Id}) {
        BOOST_REQUIRE(engine.waitForTerminal(id, TIMEOUT_MS));
        BOOST_REQUIRE_EQUAL(api_t::E_Canceled, engine.job(id)->s_Status);
    }
    api::SJob fifth{create(engine, request("noop", R"({"steps": 1})", "key-1", true))};
    BOOST_REQUIRE(fifth.s_Id != first.s_Id);
    BOOST_REQUIRE(engine.waitForTerminal(fifth.s_Id, TIMEOUT_MS));

    // Recently completed jobs are.
    auto sixth = engine.createJob(request("noop", R"({"steps": 1})", "key-1", true), created, error);
    BOOST_REQUIRE(sixth.has_value());
    BOOST_REQUIRE(created == false);
    BOOST_REQUIRE_EQUAL(fifth.s_Id, sixth->s_Id);
}

BOOST_FIXTURE_TEST_CASE(testCancelRunningJob, CFixture) {
    TEngine engine{m_Registry, m_Store, this->config()};

    api::SJob job{create(engine, request("noop", R"({"steps": 5000, "step_ms": 5})"))};
    waitForProgress(engine, job.s_Id);

    auto canceled = engine.requestCancel(job.s_Id);
    BOOST_REQUIRE(canceled.has_value());
    BOOST_REQUIRE(canceled->s_CancelRequestedAt.has_value());
    BOOST_REQUIRE(engine.waitForTerminal(job.s_Id, TIMEOUT_MS));

    job = *engine.job(job.s_Id);
    BOOST_REQUIRE_EQUAL(api_t::E_Canceled, job.s_Status);
    BOOST_REQUIRE(job.s_CanceledAt.has_value());
    BOOST_REQUIRE(job.s_Progress.s_Completed < 5000);
    BOOST_REQUIRE(engine.result(job.s_Id).has_value() == false);

    // The job stops promptly once cancellation is observed.
    std::uint64_t completed{job.s_Progress.s_Completed};
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    BOOST_REQUIRE_EQUAL(completed, engine.job(job.s_Id)->s_Progress.s_Completed);

    api::TJobEventVec events{engine.events(job.s_Id, 0, 0)};
    BOOST_REQUIRE_EQUAL("canceled", events[events.size() - 2].s_Kind);

    // Canceling a terminal job changes nothing.
    BOOST_REQUIRE_EQUAL(api_t::E_Canceled, engine.requestCancel(job.s_Id)->s_Status);
    BOOST_REQUIRE(engine.requestCancel("job-100").has_value() == false);
}

BOOST_FIXTURE_TEST_CASE(testConcurrencyLimitAndPendingCancel, CFixture) {
    TEngine engine{m_Registry, m_Store, this->config(1)};

    api::SJob running{create(engine, request("noop", R"({"steps": 5000, "step_ms": 5})"))};
    api::SJob pending{create(engine, request("noop", R"({"steps": 1})"))};
    waitForProgress(engine, running.s_Id);
    BOOST_REQUIRE_EQUAL(api_t::E_Pending, engine.job(pending.s_Id)->s_Status);

    auto canceled = engine.requestCancel(pending.s_Id);
    BOOST_REQUIRE(canceled.has_value());
    BOOST_REQUIRE_EQUAL(api_t::E_Canceled, canceled->s_Status);
    BOOST_REQUIRE(canceled->s_StartedAt.has_value() == false);
    BOOST_REQUIRE(engine.waitForTerminal(pending.s_Id, 0));

    // The next queued job starts once the running one finishes.
    api::SJob next{create(engine, request("noop", R"({"steps": 1})"))};
    BOOST_REQUIRE_EQUAL(api_t::E_Pending, engine.job(next.s_Id)->s_Status);
    engine.requestCancel(running.s_Id);
    BOOST_REQUIRE(engine.waitForTerminal(next.s_Id, TIMEOUT_MS));
    BOOST_REQUIRE_EQUAL(api_t::E_Completed, engine.job(next.s_Id)->s_Status);
}

BOOST_FIXTURE_TEST_CASE(testFailures, CFixture) {
    TEngine engine{m_Registry, m_Store, this->config()};

    api::SJob job{create(engine, request("matrix_profile", R"({"sensor_id": "empty",)"
                                                           R"( "start": 1700000000, "end": 1700018000})"))};
    BOOST_REQUIRE(engine.waitForTerminal(job.s_Id, TIMEOUT_MS));

    job = *engine.job(job.s_Id);
    BOOST_REQUIRE_EQUAL(api_t::E_Failed, job.s_Status);
    BOOST_REQUIRE(job.s_Error.has_value());
    BOOST_REQUIRE_EQUAL(api::CJobFailure::NO_DATA, job.s_Error->s_Code);
    BOOST_REQUIRE(engine.result(job.s_Id).has_value() == false);

    api::TJobEventVec events{engine.events(job.s_Id, 0, 0)};
    BOOST_REQUIRE_EQUAL("failed", events[events.size() - 2].s_Kind);
    BOOST_REQUIRE_EQUAL(api::CJobFailure::NO_DATA,
                        std::string{events.back().s_Payload.at("error_code").as_string()});
}

BOOST_FIXTURE_TEST_CASE(testCorrelationMatrixJob, CFixture) {
    TEngine engine{m_Registry, m_Store, this->config()};

    api::SJob job{create(engine, request("correlation_matrix",
                                         R"({"sensor_ids": ["a", "b"], "start": 1700000000,)"
                                         R"( "end": "2023-11-15T03:13:20Z"})"))};
    BOOST_REQUIRE(engine.waitForTerminal(job.s_Id, TIMEOUT_MS));
    BOOST_REQUIRE_EQUAL(api_t::E_Completed, engine.job(job.s_Id)->s_Status);

    auto result = engine.result(job.s_Id);
    BOOST_REQUIRE(result.has_value());
    const json::object& document{result->as_object()};
    BOOST_REQUIRE_EQUAL("correlation_matrix", std::string{document.at("job_type").as_string()});
    BOOST_REQUIRE_EQUAL(2, document.at("sensor_ids").as_array().size());
    BOOST_REQUIRE_EQUAL(300, document.at("bucket_count").as_uint64());

    bool sawPhaseTiming{false};
    for (const auto& event : engine.events(job.s_Id, 0, 0)) {
        sawPhaseTiming |= (event.s_Kind == "phase_timing");
    }
    BOOST_REQUIRE(sawPhaseTiming);
}

BOOST_FIXTURE_TEST_CASE(testEventMatchJob, CFixture) {
    TEngine engine{m_Registry, m_Store, this->config()};

    api::SJob job{create(engine, request("event_match",
                                         R"({"focus_sensor_id": "spike_focus", "start": 1700000000,)"
                                         R"( "end": 1700018000, "candidate_sensor_ids": ["spike_follows", "a"],)"
                                         R"( "z_threshold": 6, "max_lag_buckets": 2, "tolerance_buckets": 2})"))};
    BOOST_REQUIRE(engine.waitForTerminal(job.s_Id, TIMEOUT_MS));
    job = *engine.job(job.s_Id);
    BOOST_REQUIRE_EQUAL(api_t::E_Completed, job.s_Status);
    BOOST_REQUIRE_EQUAL(api_t::E_EventMatch, job.s_Type);

    auto result = engine.result(job.s_Id);
    BOOST_REQUIRE(result.has_value());
    const json::object& document{result->as_object()};
    BOOST_REQUIRE_EQUAL("event_match", std::string{document.at("job_type").as_string()});
    BOOST_REQUIRE_EQUAL(300, document.at("bucket_count").as_uint64());

    const json::array& candidates{document.at("candidates").as_array()};
    BOOST_REQUIRE(candidates.empty() == false);
    const json::object& first{candidates[0].as_object()};
    BOOST_REQUIRE_EQUAL("spike_follows", std::string{first.at("sensor_id").as_string()});
    BOOST_REQUIRE_EQUAL(3, first.at("overlap").as_uint64());
    BOOST_REQUIRE_EQUAL(60, first.at("best_lag").as_object().at("lag_sec").as_int64());
    BOOST_REQUIRE_EQUAL(3, first.at("episodes").as_array().size());
    for (std::size_t i = 1; i < candidates.size(); ++i) {
        BOOST_REQUIRE(candidates[i].as_object().at("best_lag").is_null());
    }
}

BOOST_FIXTURE_TEST_CASE(testCooccurrenceJob, CFixture) {
    TEngine engine{m_Registry, m_Store, this->config()};

    api::SJob job{create(engine, request("cooccurrence",
                                         R"({"sensor_ids": ["spike_focus", "spike_follows", "a"],)"
                                         R"( "start": 1700000000, "end": 1700018000,)"
                                         R"( "z_threshold": 6, "tolerance_buckets": 2})"))};
    BOOST_REQUIRE(engine.waitForTerminal(job.s_Id, TIMEOUT_MS));
    job = *engine.job(job.s_Id);
    BOOST_REQUIRE_EQUAL(api_t::E_Completed, job.s_Status);
    BOOST_REQUIRE_EQUAL(api_t::E_Cooccurrence, job.s_Type);

    auto result = engine.result(job.s_Id);
    BOOST_REQUIRE(result.has_value());
    const json::object& document{result->as_object()};
    BOOST_REQUIRE_EQUAL("cooccurrence", std::string{document.at("job_type").as_string()});

    // Every shared pulse is a bucket containing both spiking sensors.
    const json::array& buckets{document.at("buckets").as_array()};
    BOOST_REQUIRE(buckets.size() >= 3);
    for (const auto& bucket : buckets) {
        const json::array& sensors{bucket.as_object().at("sensors").as_array()};
        BOOST_REQUIRE_EQUAL(2, sensors.size());
        for (const auto& sensor : sensors) {
            std::string id{sensor.as_object().at("sensor_id").as_string()};
            BOOST_TEST_REQUIRE((id == "spike_focus" || id == "spike_follows"));
        }
    }
}

BOOST_FIXTURE_TEST_CASE(testRelatedSensorsUnifiedJob, CFixture) {
    TEngine engine{m_Registry, m_Store, this->config()};

    api::SJob job{create(engine, request("related_sensors_unified",
                                         R"({"focus_sensor_id": "spike_focus", "start": 1700000000,)"
                                         R"( "end": 1700018000, "candidate_sensor_ids": ["spike_follows", "a", "b"],)"
                                         R"( "z_threshold": 6})"))};
    BOOST_REQUIRE(engine.waitForTerminal(job.s_Id, TIMEOUT_MS));
    job = *engine.job(job.s_Id);
    BOOST_REQUIRE_EQUAL(api_t::E_Completed, job.s_Status);
    BOOST_REQUIRE_EQUAL(api_t::E_RelatedSensorsUnified, job.s_Type);

    auto result = engine.result(job.s_Id);
    BOOST_REQUIRE(result.has_value());
    const json::object& document{result->as_object()};
    BOOST_REQUIRE_EQUAL("related_sensors_unified", std::string{document.at("job_type").as_string()});
    BOOST_REQUIRE_EQUAL("spike_focus", std::string{document.at("focus_sensor_id").as_string()});

    const json::array& candidates{document.at("candidates").as_array()};
    BOOST_REQUIRE(candidates.empty() == false);
    const json::object& first{candidates[0].as_object()};
    BOOST_REQUIRE_EQUAL("spike_follows", std::string{first.at("sensor_id").as_string()});
    BOOST_REQUIRE_EQUAL(1, first.at("rank").as_uint64());
    const json::object& evidence{first.at("evidence").as_object()};
    BOOST_REQUIRE_EQUAL(60, evidence.at("best_lag_sec").as_int64());
    BOOST_REQUIRE_EQUAL(3, evidence.at("events_overlap").as_uint64());

    bool sawRankerPhase{false};
    for (const auto& event : engine.events(job.s_Id, 0, 0)) {
        if (event.s_Kind == "phase_timing") {
            auto phase = event.s_Payload.find("phase");
            sawRankerPhase |= (phase != event.s_Payload.end() &&
                               phase->value().as_string() == "cooccurrence");
        }
    }
    BOOST_REQUIRE(sawRankerPhase);
}

BOOST_FIXTURE_TEST_CASE(testCancelRunningRelatedSensorsUnifiedJob, CFixture) {
    CGatedSampleStore store{m_Store};
    TEngine engine{m_Registry, store, this->config()};

    api::SJob job{create(engine, request("related_sensors_unified",
                                         R"({"focus_sensor_id": "spike_focus", "start": 1700000000,)"
                                         R"( "end": 1700018000, "z_threshold": 6})"))};
    BOOST_REQUIRE(store.waitForRead());
    BOOST_REQUIRE_EQUAL(api_t::E_Running, engine.job(job.s_Id)->s_Status);

    auto canceled = engine.requestCancel(job.s_Id);
    BOOST_REQUIRE(canceled.has_value());
    BOOST_REQUIRE(canceled->s_CancelRequestedAt.has_value());
    store.open();
    BOOST_REQUIRE(engine.waitForTerminal(job.s_Id, TIMEOUT_MS));

    job = *engine.job(job.s_Id);
    BOOST_REQUIRE_EQUAL(api_t::E_Canceled, job.s_Status);
    BOOST_REQUIRE(job.s_CanceledAt.has_value());
    BOOST_REQUIRE(job.s_Error.has_value() == false);
    BOOST_REQUIRE(engine.result(job.s_Id).has_value() == false);

    api::TJobEventVec events{engine.events(job.s_Id, 0, 0)};
    BOOST_REQUIRE_EQUAL("canceled", events[events.size() - 2].s_Kind);
}

BOOST_AUTO_TEST_SUITE_END()
