#include <gtest/gtest.h>
#include <trace/trace_report.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include "fakes.hpp"

namespace fs = std::filesystem;

TEST(TraceReport, InitSeedsJobFields) {
    TraceReport trace;
    trace.init(JobInfo{"user", "4242", "17", "99", "CERN-PROD_UCORE"}, "get_sm");

    EXPECT_EQ(trace.get_string("eventType"), "get_sm");
    EXPECT_EQ(trace.get_string("clientState"), "INIT_REPORT");
    EXPECT_EQ(trace.get_string("pq"), "CERN-PROD_UCORE");
    EXPECT_EQ(trace.get_string("jobid"), "4242");
    EXPECT_EQ(trace.get_string("taskid"), "17");
    EXPECT_EQ(trace.get_string("usrdn"), "user");
    EXPECT_EQ(trace.get_string("appid"), "99");
    EXPECT_EQ(trace.get_string("uuid").size(), 32u);
    EXPECT_TRUE(trace.has("timeStart"));
    EXPECT_TRUE(std::holds_alternative<double>(*trace.get("timeStart")));
}

TEST(TraceReport, UserDnIsDecoded) {
    EXPECT_EQ(decode_user_dn("Jane%20Doe%20123"), "Jane Doe 123");
    EXPECT_EQ(decode_user_dn("plain"), "plain");
    EXPECT_EQ(decode_user_dn("100%"), "100%");

    TraceReport trace;
    trace.init(JobInfo{"/DC=ch/CN=Jane%20Doe", "1", "2", "", ""}, "get_sm");
    EXPECT_EQ(trace.get_string("usrdn"), "/DC=ch/CN=Jane Doe");
}

TEST(TraceReport, UpdateOverwritesAndKeepsTypes) {
    TraceReport trace;
    trace.update("filesize", int64_t{1000000}).update("count", 3).update("url", "root://a");
    trace.update("url", std::string("root://b"));

    EXPECT_EQ(std::get<int64_t>(*trace.get("filesize")), 1000000);
    EXPECT_EQ(std::get<int64_t>(*trace.get("count")), 3);
    EXPECT_EQ(trace.get_string("url"), "root://b");
    EXPECT_EQ(trace.get_string("filesize"), "");
    EXPECT_FALSE(trace.get("missing").has_value());
}

TEST(TraceReport, VerifyNeedsSites) {
    TraceReport trace;
    trace.init(JobInfo{}, "get_sm");
    EXPECT_FALSE(trace.verify());
    trace.update("localSite", "CERN-PROD");
    EXPECT_FALSE(trace.verify());
    trace.update("remoteSite", "");
    EXPECT_FALSE(trace.verify());
    trace.update("remoteSite", "CERN-PROD_DATADISK");
    EXPECT_TRUE(trace.verify());
}

TEST(TraceReport, SendGoesThroughSink) {
    auto sink = std::make_shared<MemoryTraceSink>();
    TraceReport trace(sink);
    trace.init(JobInfo{}, "put_sm");

    // not sent without the mandatory fields
    EXPECT_FALSE(trace.send());
    EXPECT_TRUE(sink->records.empty());

    trace.update("localSite", "CERN-PROD").update("remoteSite", "CERN-PROD_SCRATCHDISK");
    trace.update("clientState", "DONE");
    EXPECT_TRUE(trace.send());
    ASSERT_EQ(sink->records.size(), 1u);
    EXPECT_EQ(MemoryTraceSink::str(sink->records[0], "clientState"), "DONE");
    EXPECT_EQ(trace.sent_count(), 1);

    sink->fail = true;
    EXPECT_FALSE(trace.send());
    EXPECT_EQ(trace.sent_count(), 1);
}

TEST(TraceReport, NoSinkDropsRecords) {
    TraceReport trace;
    trace.init(JobInfo{}, "get_sm");
    trace.update("localSite", "A").update("remoteSite", "B");
    EXPECT_FALSE(trace.send());
    EXPECT_EQ(trace.sent_count(), 0);
}

TEST(TraceReport, YamlLine) {
    TraceReport trace;
    trace.update("eventType", "get_sm").update("filesize", int64_t{42}).update("stateReason", "a: b");
    std::string line = trace.to_yaml();
    EXPECT_EQ(line.find('\n'), std::string::npos);

    YAML::Node n = YAML::Load(line);
    EXPECT_EQ(n["eventType"].as<std::string>(), "get_sm");
    EXPECT_EQ(n["filesize"].as<int64_t>(), 42);
    EXPECT_EQ(n["stateReason"].as<std::string>(), "a: b");
}

TEST(TraceReport, FileSinkAppendsLines) {
    fs::path dir = fs::temp_directory_path() / ("xstage_trace_test_" + std::to_string(getpid()));
    fs::path path = dir / "traces.log";

    auto sink = std::make_shared<FileTraceSink>(path.string());
    TraceReport trace(sink);
    trace.init(JobInfo{}, "get_sm");
    trace.update("localSite", "A").update("remoteSite", "B");
    EXPECT_TRUE(trace.send());
    trace.update("clientState", "DONE");
    EXPECT_TRUE(trace.send());

    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(YAML::Load(lines[0])["clientState"].as<std::string>(), "INIT_REPORT");
    EXPECT_EQ(YAML::Load(lines[1])["clientState"].as<std::string>(), "DONE");

    std::error_code ec;
    fs::remove_all(dir, ec);
}
