#include <tether/core/status.h>

#include <gtest/gtest.h>

#include <string>

using namespace tether::core;

// ---------------------------------------------------------------------------
// 1. Success and failure construction
// ---------------------------------------------------------------------------
TEST(StatusTest, SuccessIsOkWithNoCode) {
    auto status = Status::success();
    EXPECT_TRUE(status.ok);
    EXPECT_EQ(status.code, ErrorCode::None);
    EXPECT_TRUE(status.message.empty());
    EXPECT_EQ(status.format(), "ok");
}

TEST(StatusTest, FailureCarriesCodeAndMessage) {
    auto status = Status::failure(ErrorCode::NotFound, "no handler for /x/y");
    EXPECT_FALSE(status.ok);
    EXPECT_EQ(status.code, ErrorCode::NotFound);
    EXPECT_EQ(status.message, "no handler for /x/y");
    EXPECT_EQ(status.format(), "not_found: no handler for /x/y");
}

TEST(StatusTest, FailureWithoutMessageFormatsCodeOnly) {
    EXPECT_EQ(Status::failure(ErrorCode::Timeout, "").format(), "timeout");
}

// ---------------------------------------------------------------------------
// 2. with_context
// ---------------------------------------------------------------------------
TEST(StatusTest, WithContextPrefixesMessageAndKeepsCode) {
    auto status = Status::failure(ErrorCode::DecodeError, "bad json")
                      .with_context("loading app://home failed");
    EXPECT_EQ(status.code, ErrorCode::DecodeError);
    EXPECT_EQ(status.message, "loading app://home failed: bad json");
}

TEST(StatusTest, WithContextOnSuccessIsNoOp) {
    auto status = Status::success().with_context("ignored");
    EXPECT_TRUE(status.ok);
    EXPECT_TRUE(status.message.empty());
}

// ---------------------------------------------------------------------------
// 3. Wire names
// ---------------------------------------------------------------------------
TEST(StatusTest, ErrorCodeNamesAreSnakeCase) {
    EXPECT_STREQ(error_code_name(ErrorCode::ProtocolAnomaly), "protocol_anomaly");
    EXPECT_STREQ(error_code_name(ErrorCode::TransportTerminal), "transport_terminal");
    EXPECT_STREQ(error_code_name(ErrorCode::AlreadyRegistered), "already_registered");
}

TEST(StatusTest, ErrorCodeNamesMapBack) {
    for (auto code : {ErrorCode::NotFound, ErrorCode::DecodeError, ErrorCode::HandlerFailure,
                      ErrorCode::InvalidArgument, ErrorCode::Shutdown, ErrorCode::Timeout}) {
        EXPECT_EQ(error_code_from_name(error_code_name(code)), code);
    }
}

TEST(StatusTest, UnknownErrorNameIsHandlerFailure) {
    EXPECT_EQ(error_code_from_name("exploded"), ErrorCode::HandlerFailure);
    EXPECT_EQ(error_code_from_name(""), ErrorCode::HandlerFailure);
}

// ---------------------------------------------------------------------------
// 4. FatalError
// ---------------------------------------------------------------------------
TEST(StatusTest, FatalErrorIsRuntimeError) {
    try {
        throw FatalError("menu bar construction failed");
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "menu bar construction failed");
    }
}
