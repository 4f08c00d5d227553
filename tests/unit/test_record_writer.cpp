#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include <boost/json.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "exceptions.h"
#include "leaks.h"
#include "record_writer.h"
#include "sink.h"
#include "test_utils.h"

namespace memscope::tracking_api {
namespace {

using namespace std::chrono_literals;
using ::testing::HasSubstr;
using ::testing::Not;
using test_utils::makeRecord;
using test_utils::StringSink;
using test_utils::TempDir;

ProfileSession
sampleSession()
{
    ProfileSession session;
    session.process_id = 1234;
    session.command = "run \"quoted\" arg";
    session.start_time = wall_clock_t::time_point(1700000000000ms);
    session.end_time = session.start_time + 2500ms;
    session.duration = 2500ms;
    session.stop_reason = StopReason::TIMEOUT_EXCEEDED;
    session.samples_taken = 3;
    session.samples_skipped = 1;
    session.interval = 1000ms;
    session.max_duration = 60000ms;

    MemorySnapshot& snapshot = session.final_snapshot;
    snapshot.total_allocated = 500;
    snapshot.total_freed = 200;
    snapshot.current_usage = 300;
    snapshot.peak_usage = 450;
    snapshot.allocation_count = 3;
    snapshot.free_count = 1;
    AllocationRecord record = makeRecord(200, session.start_time);
    record.call_stack = {"main+0x10", "__libc_start_main+0x80"};
    snapshot.active_allocations[0x2000] = record;
    snapshot.active_allocations[0x1000] = makeRecord(100, session.start_time);

    session.leak_summary = api::analyzeLeaks(snapshot);
    return session;
}

std::string
render(const ProfileSession& session, int indent = 2)
{
    std::string out;
    JsonRecordWriter writer(std::make_unique<StringSink>(out), indent);
    EXPECT_TRUE(writer.writeSession(session));
    EXPECT_TRUE(writer.finish());
    return out;
}

TEST(JsonRecordWriterTest, WritesEverySessionField)
{
    const std::string json = render(sampleSession());
    EXPECT_EQ(json.back(), '\n');

    const boost::json::object document = boost::json::parse(json).as_object();
    EXPECT_EQ(document.at("format").as_string(), "memscope");
    EXPECT_EQ(document.at("version").as_int64(), 1);
    EXPECT_EQ(document.at("pid").as_int64(), 1234);
    EXPECT_EQ(document.at("command").as_string(), "run \"quoted\" arg");
    EXPECT_EQ(document.at("start_time").as_string(), "2023-11-14T22:13:20.000Z");
    EXPECT_EQ(document.at("end_time").as_string(), "2023-11-14T22:13:22.500Z");
    EXPECT_EQ(document.at("duration_ms").as_int64(), 2500);
    EXPECT_EQ(document.at("stop_reason").as_string(), "TimeoutExceeded");
    EXPECT_TRUE(document.at("exit_status").is_null());
    EXPECT_EQ(document.at("interval_ms").as_int64(), 1000);
    EXPECT_EQ(document.at("max_duration_ms").as_int64(), 60000);
    EXPECT_EQ(boost::json::value_to<uint64_t>(document.at("samples_taken")), 3u);
    EXPECT_EQ(boost::json::value_to<uint64_t>(document.at("samples_skipped")), 1u);

    const boost::json::object& stats = document.at("memory_stats").as_object();
    EXPECT_EQ(boost::json::value_to<size_t>(stats.at("total_allocated")), 500u);
    EXPECT_EQ(boost::json::value_to<size_t>(stats.at("total_freed")), 200u);
    EXPECT_EQ(boost::json::value_to<size_t>(stats.at("current_usage")), 300u);
    EXPECT_EQ(boost::json::value_to<size_t>(stats.at("peak_usage")), 450u);
    EXPECT_EQ(boost::json::value_to<uint64_t>(stats.at("allocation_count")), 3u);
    EXPECT_EQ(boost::json::value_to<uint64_t>(stats.at("free_count")), 1u);

    const boost::json::array& active = stats.at("active_allocations").as_array();
    ASSERT_EQ(active.size(), 2u);
    const boost::json::object& second = active[1].as_object();
    EXPECT_EQ(second.at("address").as_string(), "0x2000");
    EXPECT_EQ(boost::json::value_to<size_t>(second.at("size")), 200u);
    const boost::json::array& call_stack = second.at("call_stack").as_array();
    ASSERT_EQ(call_stack.size(), 2u);
    EXPECT_EQ(call_stack[0].as_string(), "main+0x10");

    const boost::json::object& leaks = document.at("leak_summary").as_object();
    EXPECT_EQ(boost::json::value_to<size_t>(leaks.at("total_leaked_bytes")), 300u);
    EXPECT_EQ(boost::json::value_to<size_t>(leaks.at("leak_count")), 2u);
    EXPECT_EQ(boost::json::value_to<size_t>(leaks.at("largest_leak")), 200u);
    EXPECT_EQ(leaks.at("leaks_by_size").as_array().size(), 2u);
}

TEST(JsonRecordWriterTest, PrettyOutputIsIndented)
{
    const std::string json = render(sampleSession());
    EXPECT_THAT(json, HasSubstr("\n  \"pid\": 1234,\n"));
    EXPECT_THAT(json, HasSubstr("\"memory_stats\": {\n    \"total_allocated\": 500"));
    EXPECT_THAT(json, HasSubstr("\"leaks_by_size\": [\n"));
}

TEST(JsonRecordWriterTest, ExitStatusAndEmptyLedger)
{
    ProfileSession session;
    session.exit_status = 0;
    const std::string json = render(session);

    EXPECT_THAT(json, HasSubstr("\"exit_status\": 0"));
    EXPECT_THAT(json, HasSubstr("\"active_allocations\": []"));
    EXPECT_THAT(json, HasSubstr("\"largest_leak\": null"));
    EXPECT_THAT(json, HasSubstr("\"leaks_by_size\": []"));
}

TEST(JsonRecordWriterTest, ActiveAllocationsAreSortedByAddress)
{
    std::string json = render(sampleSession());
    auto first = json.find("\"0x1000\"");
    auto second = json.find("\"0x2000\"");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);

    auto largest = json.find("\"size\": 200", json.find("leaks_by_size"));
    auto smallest = json.find("\"size\": 100", json.find("leaks_by_size"));
    EXPECT_LT(largest, smallest);
}

TEST(JsonRecordWriterTest, CompactOutputHasNoWhitespace)
{
    std::string json = render(sampleSession(), 0);
    EXPECT_THAT(json, HasSubstr("\"pid\":1234,"));
    EXPECT_EQ(json.find('\n'), json.size() - 1);
}

TEST(JsonRecordWriterTest, SinkFailureIsReported)
{
    std::string out;
    JsonRecordWriter writer(std::make_unique<StringSink>(out, true));
    EXPECT_FALSE(writer.writeSession(sampleSession()));
}

TEST(JsonRecordWriterTest, FormatsTimestampsInUtc)
{
    EXPECT_EQ(formatTimestamp(wall_clock_t::time_point(1234ms)), "1970-01-01T00:00:01.234Z");
    EXPECT_EQ(formatTimestamp(wall_clock_t::time_point{}), "1970-01-01T00:00:00.000Z");
}

TEST(JsonRecordWriterTest, ControlCharactersAreEscaped)
{
    ProfileSession session;
    session.command = "line\nbreak\ttab \\ \x01";
    const std::string json = render(session, 0);

    EXPECT_THAT(json, HasSubstr("line\\nbreak\\ttab"));
    EXPECT_THAT(json, HasSubstr("\\u0001"));
    EXPECT_EQ(boost::json::parse(json).as_object().at("command").as_string(), session.command);
}

TEST(JsonRecordWriterTest, InvalidUtf8IsDroppedFromStrings)
{
    ProfileSession session = sampleSession();
    session.command = "prog \xff\xfe arg";
    session.final_snapshot.active_allocations[0x1000].call_stack = {"sym\xc3", "caf\xc3\xa9"};

    for (int indent : {0, 2}) {
        const std::string json = render(session, indent);

        boost::json::error_code ec;
        const boost::json::value document = boost::json::parse(json, ec);
        ASSERT_FALSE(ec) << ec.message();
        EXPECT_EQ(document.as_object().at("command").as_string(), "prog  arg");

        const boost::json::object& first = document.as_object()
                                                   .at("memory_stats")
                                                   .as_object()
                                                   .at("active_allocations")
                                                   .as_array()[0]
                                                   .as_object();
        const boost::json::array& call_stack = first.at("call_stack").as_array();
        ASSERT_EQ(call_stack.size(), 2u);
        EXPECT_EQ(call_stack[0].as_string(), "sym");
        EXPECT_EQ(call_stack[1].as_string(), "caf\xc3\xa9");
    }
}

TEST(FileSinkTest, WritesBufferedData)
{
    TempDir dir;
    const std::string path = dir.file("out.txt");
    {
        io::FileSink sink(path, false, false);
        ASSERT_TRUE(sink.writeAll("hello ", 6));
        ASSERT_TRUE(sink.writeAll("world", 5));
        ASSERT_TRUE(sink.close());
    }
    EXPECT_EQ(test_utils::readFile(path), "hello world");
}

TEST(FileSinkTest, LargeWritesAreFlushed)
{
    TempDir dir;
    const std::string path = dir.file("big.bin");
    const std::string chunk(100 * 1024, 'x');
    {
        io::FileSink sink(path, false, false);
        ASSERT_TRUE(sink.writeAll(chunk.data(), chunk.size()));
        ASSERT_TRUE(sink.writeAll(chunk.data(), chunk.size()));
    }
    EXPECT_EQ(std::filesystem::file_size(path), 2 * chunk.size());
}

TEST(FileSinkTest, RefusesToOverwriteUnlessAsked)
{
    TempDir dir;
    const std::string path = dir.file("existing.json");
    test_utils::writeFile(path, "old");

    EXPECT_THROW(io::FileSink(path, false, false), exception::IoError);
    {
        io::FileSink sink(path, true, false);
        ASSERT_TRUE(sink.writeAll("new", 3));
        ASSERT_TRUE(sink.close());
    }
    EXPECT_EQ(test_utils::readFile(path), "new");
}

TEST(FileSinkTest, UnwritableDirectoryThrows)
{
    EXPECT_THROW(io::FileSink("/nonexistent-memscope-dir/out.json", true, false), exception::IoError);
}

TEST(FileSinkTest, CompressesWithLz4Frame)
{
    TempDir dir;
    const std::string path = dir.file("profile.json");
    const std::string payload(10000, 'a');
    {
        io::FileSink sink(path, true, true);
        ASSERT_TRUE(sink.writeAll(payload.data(), payload.size()));
        ASSERT_TRUE(sink.close());
    }

    std::string contents = test_utils::readFile(path);
    ASSERT_GE(contents.size(), 4u);
    EXPECT_EQ(contents.substr(0, 4), std::string("\x04\x22\x4d\x18", 4));
    EXPECT_LT(contents.size(), payload.size());
    EXPECT_FALSE(std::filesystem::exists(path + ".lz4.tmp"));
    EXPECT_THAT(contents, Not(HasSubstr("aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa")));
}

}  // namespace
}  // namespace memscope::tracking_api
