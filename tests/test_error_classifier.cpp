#include <gtest/gtest.h>
#include <transfer/transfer_error.hpp>

class ErrorClassifierTest : public ::testing::Test {
protected:
    ErrorClassifier classifier;
};

TEST_F(ErrorClassifierTest, UnknownOutputFallsBackPerDirection) {
    auto in = classifier.classify("something odd happened", true);
    EXPECT_EQ(in.code(), ErrorCode::STAGEINFAILED);
    EXPECT_EQ(in.state(), "COPY_ERROR");
    EXPECT_NE(in.message().find("something odd happened"), std::string::npos);

    auto out = classifier.classify("something odd happened", false);
    EXPECT_EQ(out.code(), ErrorCode::STAGEOUTFAILED);
    EXPECT_EQ(out.state(), "COPY_ERROR");
}

TEST_F(ErrorClassifierTest, EmptyOutputAsksToConsultLog) {
    auto e = classifier.classify("  \n", true);
    EXPECT_EQ(e.code(), ErrorCode::STAGEINFAILED);
    EXPECT_NE(e.message().find("consult log"), std::string::npos);
}

TEST_F(ErrorClassifierTest, NoSpaceDependsOnDirection) {
    std::string out = "Run: [ERROR] Server responded with an error: [3017] No space left on device";
    auto put = classifier.classify(out, false);
    EXPECT_EQ(put.code(), ErrorCode::NOREMOTESPACE);
    EXPECT_EQ(put.state(), "NO_SPACE");
    EXPECT_NE(put.code(), ErrorCode::STAGEOUTFAILED);

    auto get = classifier.classify(out, true);
    EXPECT_EQ(get.code(), ErrorCode::NOLOCALSPACE);
}

TEST_F(ErrorClassifierTest, QuotaExceededIsNoSpace) {
    auto e = classifier.classify("[ERROR] Disk quota exceeded", false);
    EXPECT_EQ(e.state(), "NO_SPACE");
}

TEST_F(ErrorClassifierTest, TimeoutIsRetriable) {
    auto e = classifier.classify("[ERROR] Operation expired", true);
    EXPECT_EQ(e.code(), ErrorCode::STAGEINTIMEOUT);
    EXPECT_EQ(e.state(), "CP_TIMEOUT");
    EXPECT_TRUE(e.retriable());

    auto o = classifier.classify("copy command timed out after 300 seconds", false);
    EXPECT_EQ(o.code(), ErrorCode::STAGEOUTTIMEOUT);
}

TEST_F(ErrorClassifierTest, MissingFileDependsOnDirection) {
    std::string out = "[ERROR] Server responded with an error: [3011] No such file or directory";
    EXPECT_EQ(classifier.classify(out, true).state(), "MISSING_INPUT");
    EXPECT_EQ(classifier.classify(out, true).code(), ErrorCode::MISSINGINPUTFILE);
    EXPECT_EQ(classifier.classify(out, false).state(), "NO_FILE");
    EXPECT_EQ(classifier.classify(out, false).code(), ErrorCode::NOSUCHFILE);
}

TEST_F(ErrorClassifierTest, ChecksumMismatchOnlyOnStageOut) {
    std::string out = "checksum of the remote file does not match the checksum of the local file";
    auto e = classifier.classify(out, false);
    EXPECT_EQ(e.code(), ErrorCode::PUTADMISMATCH);
    EXPECT_EQ(e.state(), "AD_MISMATCH");
    EXPECT_EQ(classifier.classify(out, true).state(), "COPY_ERROR");
}

TEST_F(ErrorClassifierTest, KnownPatterns) {
    EXPECT_EQ(classifier.classify("Could not establish context", true).state(), "CONTEXT_FAIL");
    EXPECT_EQ(classifier.classify("[ERROR] File exists", false).code(), ErrorCode::FILEEXISTS);
    EXPECT_EQ(classifier.classify("query chksum is not supported", false).code(), ErrorCode::CHKSUMNOTSUP);
    EXPECT_EQ(classifier.classify("globus_xio: System error", false).code(), ErrorCode::PUTGLOBUSSYSERR);
    EXPECT_EQ(classifier.classify("connect: Connection refused", true).state(), "SERVICE_ERROR");
    EXPECT_EQ(classifier.classify("Network is unreachable", true).code(), ErrorCode::UNREACHABLENETWORK);
    EXPECT_EQ(classifier.classify("open: Permission Denied", true).code(), ErrorCode::PERMISSIONDENIED);
}

TEST_F(ErrorClassifierTest, EarlierRuleWins) {
    // both a timeout and a space problem: timeout is checked first
    auto e = classifier.classify("No space left on device; connection timed out", false);
    EXPECT_EQ(e.state(), "CP_TIMEOUT");
}

TEST_F(ErrorClassifierTest, CustomRules) {
    ErrorRule rule{"\\[3010\\]", Direction::ANY, ErrorCode::PERMISSIONDENIED,
                   ErrorCode::PERMISSIONDENIED, "AUTH_FAIL", "auth: ", false, false};
    classifier.add_rule_front(rule);
    auto e = classifier.classify("[ERROR] [3010] not allowed", true);
    EXPECT_EQ(e.state(), "AUTH_FAIL");
    EXPECT_EQ(e.message(), "auth: [ERROR] [3010] not allowed");

    ErrorClassifier empty(std::vector<ErrorRule>{});
    EXPECT_EQ(empty.size(), 0u);
    EXPECT_EQ(empty.classify("No space left on device", false).code(), ErrorCode::STAGEOUTFAILED);
}

TEST(TypedError, Factories) {
    auto in = TypedError::ad_mismatch(true, "bad sum");
    EXPECT_EQ(in.code(), ErrorCode::GETADMISMATCH);
    EXPECT_EQ(in.state(), "AD_MISMATCH");
    EXPECT_EQ(TypedError::ad_mismatch(false, "").numeric_code(), 1172);

    auto relabeled = in.with_state("STAGEIN_ATTEMPT_FAILED");
    EXPECT_EQ(relabeled.code(), ErrorCode::GETADMISMATCH);
    EXPECT_EQ(relabeled.message(), "bad sum");
    EXPECT_EQ(relabeled.describe(), "[1171] STAGEIN_ATTEMPT_FAILED: bad sum");
    EXPECT_STREQ(error_code_name(ErrorCode::NOREMOTESPACE), "NOREMOTESPACE");
}
