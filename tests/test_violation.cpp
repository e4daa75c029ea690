#include <gtest/gtest.h>
#include "audit/violation.hpp"
#include "audit/violation_recorder.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace warden::audit;

TEST(ViolationTest, CodesHaveNamespacedTypes) {
    EXPECT_STREQ(violation_type_for(ViolationCode::FS_DENIED), "sandbox.fs.denied");
    EXPECT_STREQ(violation_type_for(ViolationCode::FS_TRAVERSAL), "sandbox.fs.traversal");
    EXPECT_STREQ(violation_type_for(ViolationCode::NET_DENIED), "sandbox.net.denied");
    EXPECT_STREQ(violation_type_for(ViolationCode::VIOLATION_THRESHOLD),
                 "sandbox.violation_threshold");
}

TEST(ViolationTest, CodeStringsRoundTrip) {
    for (auto code : {ViolationCode::DYNAMIC_CODE, ViolationCode::FS_DENIED,
                      ViolationCode::FS_TRAVERSAL, ViolationCode::NET_DENIED,
                      ViolationCode::MEMORY_SOFT_LIMIT, ViolationCode::TIMEOUT,
                      ViolationCode::SERIALIZE_ERROR, ViolationCode::VIOLATION_THRESHOLD}) {
        auto parsed = violation_code_from_string(violation_code_to_string(code));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, code);
    }
    EXPECT_FALSE(violation_code_from_string("NOT_A_CODE").has_value());
}

TEST(ViolationTest, DefaultSeverities) {
    EXPECT_EQ(default_severity(ViolationCode::DYNAMIC_CODE), Severity::HIGH);
    EXPECT_EQ(default_severity(ViolationCode::TIMEOUT), Severity::HIGH);
    EXPECT_EQ(default_severity(ViolationCode::FS_DENIED), Severity::MEDIUM);
    EXPECT_EQ(default_severity(ViolationCode::NET_DENIED), Severity::MEDIUM);
    EXPECT_EQ(severity_from_string("high"), Severity::HIGH);
    EXPECT_EQ(severity_from_string("bogus"), Severity::MEDIUM);
}

TEST(ViolationTest, EventToJson) {
    nlohmann::json metadata;
    metadata["path"] = "/blocked/secret.env";
    auto event = ViolationEvent::make(ViolationCode::FS_DENIED, "Read denied", metadata);

    auto j = event.to_json();
    EXPECT_EQ(j["type"], "sandbox.fs.denied");
    EXPECT_EQ(j["severity"], "medium");
    EXPECT_EQ(j["code"], "FS_DENIED");
    EXPECT_EQ(j["message"], "Read denied");
    EXPECT_EQ(j["metadata"]["path"], "/blocked/secret.env");
}

TEST(ViolationRecorderTest, KeepsEmissionOrderAndForwards) {
    std::vector<std::string> seen;
    ViolationRecorder recorder(std::nullopt, [&seen](const ViolationEvent& e) {
        seen.push_back(e.type);
    });

    recorder.emit(ViolationEvent::make(ViolationCode::FS_DENIED, "a"));
    recorder.emit(ViolationEvent::make(ViolationCode::NET_DENIED, "b"));
    recorder.emit(ViolationEvent::make(ViolationCode::MEMORY_SOFT_LIMIT, "c"));

    ASSERT_EQ(recorder.count(), 3u);
    EXPECT_EQ(recorder.events()[0].code, ViolationCode::FS_DENIED);
    EXPECT_EQ(recorder.events()[2].code, ViolationCode::MEMORY_SOFT_LIMIT);
    EXPECT_EQ(seen, (std::vector<std::string>{
        "sandbox.fs.denied", "sandbox.net.denied", "sandbox.memory.soft_limit"}));
    EXPECT_FALSE(recorder.threshold_reached());
}

TEST(ViolationRecorderTest, ThresholdEmittedOnce) {
    ViolationRecorder recorder(2, nullptr);

    EXPECT_FALSE(recorder.emit(ViolationEvent::make(ViolationCode::FS_DENIED, "1")));
    EXPECT_TRUE(recorder.emit(ViolationEvent::make(ViolationCode::FS_DENIED, "2")));
    EXPECT_TRUE(recorder.threshold_reached());

    // Emission path already appended it; later triggers are no-ops
    EXPECT_FALSE(recorder.emit_threshold_once());
    EXPECT_TRUE(recorder.emit(ViolationEvent::make(ViolationCode::NET_DENIED, "3")));

    size_t thresholds = 0;
    for (const auto& e : recorder.events()) {
        if (e.code == ViolationCode::VIOLATION_THRESHOLD) {
            thresholds++;
        }
    }
    EXPECT_EQ(thresholds, 1u);
    EXPECT_EQ(recorder.count(), 4u);
    EXPECT_EQ(recorder.events()[2].code, ViolationCode::VIOLATION_THRESHOLD);
}

TEST(ViolationRecorderTest, NoThresholdWithoutLimit) {
    ViolationRecorder recorder;
    for (int i = 0; i < 10; i++) {
        recorder.emit(ViolationEvent::make(ViolationCode::FS_DENIED, "x"));
    }
    EXPECT_FALSE(recorder.threshold_reached());
    EXPECT_FALSE(recorder.emit_threshold_once());
    EXPECT_EQ(recorder.count(), 10u);
}

TEST(ViolationRecorderTest, FindsFirstHighSeverity) {
    ViolationRecorder recorder;
    recorder.emit(ViolationEvent::make(ViolationCode::FS_DENIED, "medium"));
    EXPECT_FALSE(recorder.has_high_severity());

    recorder.emit(ViolationEvent::make(ViolationCode::DYNAMIC_CODE, "high"));
    recorder.emit(ViolationEvent::make(ViolationCode::TIMEOUT, "also high"));

    auto high = recorder.first_high_severity();
    ASSERT_TRUE(high.has_value());
    EXPECT_EQ(high->code, ViolationCode::DYNAMIC_CODE);
}

TEST(ViolationRecorderTest, ThrowingCallbackDoesNotLoseEvent) {
    ViolationRecorder recorder(std::nullopt, [](const ViolationEvent&) {
        throw std::runtime_error("sink offline");
    });

    EXPECT_NO_THROW(recorder.emit(ViolationEvent::make(ViolationCode::NET_DENIED, "x")));
    EXPECT_EQ(recorder.count(), 1u);
}
