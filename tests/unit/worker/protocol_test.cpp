#include <gtest/gtest.h>
#include <tankobon/worker/protocol.hpp>

#include <set>

using namespace tankobon;
using namespace tankobon::worker;

TEST(ProtocolTest, EveryCommandNameParsesBackAndIsUnique) {
    std::set<std::string_view> names;
    for (auto command : kAllCommands) {
        auto name = commandName(command);
        EXPECT_TRUE(names.insert(name).second) << name;
        auto parsed = parseCommand(name);
        ASSERT_TRUE(parsed.has_value()) << name;
        EXPECT_EQ(*parsed, command);
    }
    EXPECT_EQ(names.size(), 33u);
    EXPECT_FALSE(parseCommand("init").has_value());
    EXPECT_FALSE(parseCommand("Queue-Chapter").has_value());
}

TEST(ProtocolTest, TimeoutClasses) {
    EXPECT_EQ(timeoutClass(Command::Start), TimeoutClass::Start);
    EXPECT_EQ(timeoutClass(Command::Stop), TimeoutClass::Stop);
    EXPECT_EQ(timeoutClass(Command::GetStorageStats), TimeoutClass::Query);
    EXPECT_EQ(resultKey(Command::QueueManga), "queueIds");
    EXPECT_EQ(resultKey(Command::DeleteChapter), "");
    EXPECT_EQ(commandName(Command::PerformStorageCleanup), "perform-storage-cleanup");
    EXPECT_EQ(resultKey(Command::PerformStorageCleanup), "");
    EXPECT_EQ(resultKey(Command::GetStorageUsage), "usage");
}

TEST(ProtocolTest, CommandEnvelopeOnTheWire) {
    HostMessage message =
        CommandMessage{Command::QueueChapter, 42, json{{"mangaId", "m1"}, {"chapterId", "c1"}}};
    auto wire = json::parse(encode(message));
    EXPECT_EQ(wire["type"], "queue-chapter");
    EXPECT_EQ(wire["requestId"], "42");
    EXPECT_EQ(wire["payload"]["chapterId"], "c1");

    HostMessage bare = CommandMessage{Command::IsActive, 7, nullptr};
    EXPECT_FALSE(json::parse(encode(bare)).contains("payload"));
}

TEST(ProtocolTest, DecodesInitWithDefaults) {
    auto decoded = decodeHostMessage(
        R"({"type":"init","config":{"dataDir":"/d","dbPath":"/d/db.json","extensionId":"ext","workerOptions":{"concurrency":5}}})");
    ASSERT_TRUE(decoded) << decoded.error().message;
    const auto* init = std::get_if<InitMessage>(&decoded.value());
    ASSERT_NE(init, nullptr);
    EXPECT_EQ(init->config.dataDir, "/d");
    EXPECT_EQ(init->config.extensionId, "ext");
    EXPECT_EQ(init->config.workerOptions.concurrency, 5);
    EXPECT_EQ(init->config.workerOptions.pageConcurrency, 3);
    EXPECT_EQ(init->config.workerOptions.progressFlushMs, 1500);
}

TEST(ProtocolTest, RejectsMalformedHostLines) {
    for (const char* line : {
             "not json",
             "[1,2,3]",
             R"({"requestId":"1"})",
             R"({"type":7,"requestId":"1"})",
             R"({"type":"launch-missiles","requestId":"1"})",
             R"({"type":"ping"})",
             R"({"type":"ping","requestId":12})",
             R"({"type":"ping","requestId":"12abc"})",
             R"({"type":"ping","requestId":"1","payload":[1]})",
             R"({"type":"init"})",
             R"({"type":"init","config":{"dbPath":"x"}})",
         }) {
        auto decoded = decodeHostMessage(line);
        EXPECT_FALSE(decoded) << line;
        if (!decoded) {
            EXPECT_EQ(decoded.error().code, ErrorCode::InvalidData) << line;
        }
    }
}

TEST(ProtocolTest, WorkerResultCarriesCommandName) {
    WorkerMessage message = ResultMessage{9, std::string("ping"), json{{"timestamp", 123}}};
    auto decoded = decodeWorkerMessage(encode(message));
    ASSERT_TRUE(decoded);
    const auto* result = std::get_if<ResultMessage>(&decoded.value());
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->requestId, 9u);
    EXPECT_EQ(result->command, "ping");
    EXPECT_EQ(result->result["timestamp"], 123);
}

TEST(ProtocolTest, ErrorWithoutRequestIdIsAccepted) {
    auto decoded = decodeWorkerMessage(R"({"type":"error","error":"boom"})");
    ASSERT_TRUE(decoded);
    const auto* error = std::get_if<ErrorMessage>(&decoded.value());
    ASSERT_NE(error, nullptr);
    EXPECT_FALSE(error->requestId.has_value());
    EXPECT_EQ(error->error, "boom");

    EXPECT_FALSE(decodeWorkerMessage(R"({"type":"error","requestId":"x","error":"boom"})"));
    EXPECT_FALSE(decodeWorkerMessage(R"({"type":"error","requestId":"1"})"));
}

TEST(ProtocolTest, LifecycleAndEventMessages) {
    auto ready = decodeWorkerMessage(R"({"type":"ready","timestamp":1700000000000})");
    ASSERT_TRUE(ready);
    EXPECT_EQ(std::get<ReadyMessage>(ready.value()).timestamp, 1700000000000);
    EXPECT_EQ(messageType(ready.value()), "ready");

    auto fatal = decodeWorkerMessage(R"({"type":"fatal-error","error":"db locked","stack":"at x"})");
    ASSERT_TRUE(fatal);
    EXPECT_EQ(std::get<FatalErrorMessage>(fatal.value()).stack, "at x");

    auto event =
        decodeWorkerMessage(R"({"type":"event","event":{"type":"download-started","queueId":3}})");
    ASSERT_TRUE(event);
    EXPECT_EQ(std::get<EventMessage>(event.value()).event["queueId"], 3);

    EXPECT_FALSE(decodeWorkerMessage(R"({"type":"event","event":"x"})"));
    EXPECT_FALSE(decodeWorkerMessage(R"({"type":"progress"})"));
}
