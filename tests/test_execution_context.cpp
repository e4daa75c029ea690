#include <gtest/gtest.h>
#include "ipc/channel.hpp"
#include "runtime/ambient.hpp"
#include "runtime/execution_context.hpp"
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <thread>
#include <unistd.h>

using namespace warden::runtime;
using warden::audit::ViolationCode;
using warden::ipc::ContextMessage;
using warden::ipc::FailureKind;
using warden::ipc::MessageDecoder;
using warden::ipc::MessageType;
using warden::policy::PolicyConfig;

namespace {

PolicyConfig make_policy() {
    PolicyConfig policy;
    policy.allowed_read_paths = {"/allowed"};
    policy.virtual_files = {{"/allowed/config.json", "{\"ok\":true}"}};
    return policy;
}

// Collect messages up to and including the terminal one
std::vector<ContextMessage> collect(ExecutionContext& context) {
    std::vector<ContextMessage> messages;
    for (int i = 0; i < 500; i++) {
        auto msg = context.next_message(std::chrono::milliseconds(10));
        if (!msg) {
            continue;
        }
        bool terminal = msg->is_terminal();
        messages.push_back(std::move(*msg));
        if (terminal) {
            break;
        }
    }
    return messages;
}

} // namespace

TEST(ChannelTest, DeliversInOrderAndDrainsAfterClose) {
    warden::ipc::Channel<int> channel;
    EXPECT_TRUE(channel.push(1));
    EXPECT_TRUE(channel.push(2));
    channel.close();
    EXPECT_FALSE(channel.push(3));

    EXPECT_EQ(channel.try_pop(), 1);
    EXPECT_EQ(channel.pop_for(std::chrono::milliseconds(1)), 2);
    EXPECT_FALSE(channel.pop_for(std::chrono::milliseconds(1)).has_value());
    EXPECT_TRUE(channel.closed());
}

TEST(ChannelTest, WaitingReaderWakesOnPush) {
    warden::ipc::Channel<std::string> channel;
    std::thread writer([&channel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.push("hello");
    });

    auto msg = channel.pop_for(std::chrono::seconds(5));
    writer.join();
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(*msg, "hello");
}

TEST(ProtocolTest, DecodesFramesSplitAcrossReads) {
    nlohmann::json metadata;
    metadata["host"] = "evil.com";
    auto violation = warden::ipc::encode_message(ContextMessage::make_violation(
        warden::audit::ViolationEvent::make(ViolationCode::NET_DENIED, "denied", metadata)));
    Value value = Value::object();
    value.set("raw", Value::bytes(Bytes{1, 2, 3}));
    auto returned = warden::ipc::encode_message(ContextMessage::make_returned(value));
    ASSERT_TRUE(violation.has_value());
    ASSERT_TRUE(returned.has_value());

    std::vector<uint8_t> stream = *violation;
    stream.insert(stream.end(), returned->begin(), returned->end());

    MessageDecoder decoder;
    std::vector<ContextMessage> messages;
    for (uint8_t byte : stream) {
        decoder.feed(&byte, 1);
        while (auto msg = decoder.next()) {
            messages.push_back(std::move(*msg));
        }
    }

    EXPECT_FALSE(decoder.failed());
    EXPECT_EQ(decoder.pending(), 0u);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].violation.code, ViolationCode::NET_DENIED);
    EXPECT_EQ((*messages[0].violation.metadata)["host"], "evil.com");
    EXPECT_EQ(messages[1].type, MessageType::RETURNED);
    EXPECT_EQ(messages[1].value.get("raw")->as_bytes(), (Bytes{1, 2, 3}));
}

TEST(ProtocolTest, CorruptFrameFailsDecoder) {
    auto frame = warden::ipc::encode_message(
        ContextMessage::make_failed(FailureKind::RUNTIME_ERROR, "boom"));
    ASSERT_TRUE(frame.has_value());
    (*frame)[0] ^= 0xff;

    MessageDecoder decoder;
    decoder.feed(frame->data(), frame->size());
    EXPECT_FALSE(decoder.next().has_value());
    EXPECT_TRUE(decoder.failed());
    EXPECT_FALSE(decoder.error().empty());
}

TEST(ProtocolTest, FunctionValueCannotBeEncoded) {
    std::string error;
    auto frame = warden::ipc::encode_message(ContextMessage::make_returned(
        Value::function([](const std::vector<Value>&) { return Value(); })), &error);
    EXPECT_FALSE(frame.has_value());
    EXPECT_FALSE(error.empty());
}

TEST(ExecutionContextTest, ReturnsTransferredValue) {
    ExecutionContext context(make_policy(), nullptr);
    ASSERT_TRUE(context.start([](Capabilities& caps) {
        Value result = Value::object();
        result.set("config", caps.read_file("/allowed/config.json"));
        return result;
    }));

    auto messages = collect(context);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].type, MessageType::RETURNED);
    EXPECT_EQ(messages[0].value.get("config")->as_string(), "{\"ok\":true}");
}

TEST(ExecutionContextTest, ViolationsPrecedeTerminalMessage) {
    ExecutionContext context(make_policy(), nullptr);
    ASSERT_TRUE(context.start([](Capabilities& caps) -> Value {
        try {
            caps.read_file("/blocked/secret.env");
        } catch (const CapabilityError&) {
        }
        try {
            caps.fetch("https://evil.com");
        } catch (const CapabilityError&) {
        }
        return Value("done");
    }));

    auto messages = collect(context);
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].violation.code, ViolationCode::FS_DENIED);
    EXPECT_EQ(messages[1].violation.code, ViolationCode::NET_DENIED);
    EXPECT_EQ(messages[2].type, MessageType::RETURNED);
    EXPECT_EQ(messages[2].value.as_string(), "done");
}

TEST(ExecutionContextTest, UncaughtExceptionBecomesRuntimeFailure) {
    ExecutionContext context(make_policy(), nullptr);
    ASSERT_TRUE(context.start([](Capabilities&) -> Value {
        throw std::runtime_error("boom");
    }));

    auto messages = collect(context);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].type, MessageType::FAILED);
    EXPECT_EQ(messages[0].failure, FailureKind::RUNTIME_ERROR);
    EXPECT_EQ(messages[0].error, "boom");
}

TEST(ExecutionContextTest, UntransferableValueSendsSerializeError) {
    ExecutionContext context(make_policy(), nullptr);
    ASSERT_TRUE(context.start([](Capabilities&) {
        Value obj = Value::object();
        obj.set("self", obj);
        return obj;
    }));

    auto messages = collect(context);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].type, MessageType::VIOLATION);
    EXPECT_EQ(messages[0].violation.code, ViolationCode::SERIALIZE_ERROR);
    EXPECT_EQ(messages[1].type, MessageType::FAILED);
    EXPECT_EQ(messages[1].failure, FailureKind::SERIALIZATION);
}

TEST(ExecutionContextTest, AmbientGuardsBoundOnWorker) {
    ExecutionContext context(make_policy(), nullptr);
    ASSERT_TRUE(context.start([](Capabilities&) -> Value {
        return ambient::eval("2 + 2");
    }));

    auto messages = collect(context);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].violation.code, ViolationCode::DYNAMIC_CODE);
    EXPECT_EQ(messages[1].failure, FailureKind::RUNTIME_ERROR);
    EXPECT_FALSE(ambient::in_sandbox());
}

TEST(ExecutionContextTest, TerminateKillsWorkerStuckInTightLoop) {
    auto context = std::make_unique<ExecutionContext>(make_policy(), nullptr);
    ASSERT_TRUE(context->start([](Capabilities&) -> Value {
        volatile uint64_t spins = 0;
        for (;;) {
            spins = spins + 1;
        }
    }));

    pid_t pid = context->pid();
    ASSERT_GT(pid, 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(context->running());

    context->terminate();
    EXPECT_TRUE(context->terminated());
    EXPECT_FALSE(context->next_message(std::chrono::milliseconds(50)).has_value());

    context.reset();
    errno = 0;
    EXPECT_EQ(kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST(ExecutionContextTest, WorkerIsReapedAfterReturning) {
    ExecutionContext context(make_policy(), nullptr);
    ASSERT_TRUE(context.start([](Capabilities&) { return Value("done"); }));
    EXPECT_NE(context.pid(), getpid());

    auto messages = collect(context);
    ASSERT_EQ(messages.size(), 1u);

    for (int i = 0; i < 200 && context.running(); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_FALSE(context.running());
}

TEST(ExecutionContextTest, CrashedWorkerBecomesRuntimeFailure) {
    ExecutionContext context(make_policy(), nullptr);
    ASSERT_TRUE(context.start([](Capabilities& caps) -> Value {
        try {
            caps.read_file("/blocked/secret.env");
        } catch (const CapabilityError&) {
        }
        raise(SIGKILL);
        return Value("unreachable");
    }));

    auto messages = collect(context);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].violation.code, ViolationCode::FS_DENIED);
    EXPECT_EQ(messages[1].type, MessageType::FAILED);
    EXPECT_EQ(messages[1].failure, FailureKind::RUNTIME_ERROR);
    EXPECT_NE(messages[1].error.find("signal 9"), std::string::npos);
}

TEST(ExecutionContextTest, StartTwiceFails) {
    ExecutionContext context(make_policy(), nullptr);
    ASSERT_TRUE(context.start([](Capabilities&) { return Value(1); }));
    EXPECT_FALSE(context.start([](Capabilities&) { return Value(2); }));
    auto messages = collect(context);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].value.as_int(), 1);
}
