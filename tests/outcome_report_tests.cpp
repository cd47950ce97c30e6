#include <gtest/gtest.h>
#include "test_utils.hpp"
#include <reqctx/runtime/runner.hpp>
#include <reqctx/runtime/api/outcome.hpp>
#include <reqctx/runtime/api/exception.hpp>
#include <reqctx/runtime/api/json.hpp>

using namespace reqctx::runtime;

TEST(outcome_report_tests, success_with_cleanup_failure)
{
    auto result = run(environment_builder(), [](context& ctx) {
        ctx.cleanup().register_action([] { throw std::runtime_error("release failed"); });
        return 1;
    });
    
    api::Outcome msg;
    api::populate(msg, result);
    
    EXPECT_TRUE(msg.success());
    EXPECT_EQ(result.request_id(), msg.request_id());
    EXPECT_FALSE(msg.has_failure());
    ASSERT_EQ(1, msg.cleanup_failures_size());
    auto& f = msg.cleanup_failures(0);
    EXPECT_EQ(api::Failure::CLEANUP, f.kind());
    EXPECT_EQ("std::runtime_error: release failed", f.message());
    EXPECT_EQ("std::runtime_error", f.exception().name());
    EXPECT_EQ("release failed", f.exception().what());
}

TEST(outcome_report_tests, failure_with_nested_exception)
{
    auto result = run(environment_builder(), [](context&) {
        try {
            throw std::runtime_error("connection refused");
        }
        catch(...)
        {
            std::throw_with_nested(std::logic_error("could not load article"));
        }
    });
    
    api::Outcome msg;
    api::populate(msg, result);
    
    EXPECT_FALSE(msg.success());
    ASSERT_TRUE(msg.has_failure());
    EXPECT_EQ(api::Failure::HANDLER, msg.failure().kind());
    EXPECT_EQ("std::logic_error", msg.failure().exception().name());
    EXPECT_EQ("could not load article", msg.failure().exception().what());
    EXPECT_EQ("std::runtime_error", msg.failure().exception().nested().name());
    EXPECT_EQ("connection refused", msg.failure().exception().nested().what());
    EXPECT_EQ(0, msg.cleanup_failures_size());
}

TEST(outcome_report_tests, cancellation_kind)
{
    cancellation_source source;
    source.cancel();
    auto result = run(environment_builder(), [](context&) {}, source.token());
    
    api::Outcome msg;
    api::populate(msg, result);
    EXPECT_EQ(api::Failure::CANCELLATION, msg.failure().kind());
}

TEST(outcome_report_tests, json_rendering)
{
    api::Exception emsg;
    api::populate(emsg, std::make_exception_ptr(std::runtime_error("boom")));
    
    std::string json;
    ASSERT_TRUE(no_exception([&] { json = api::as_json(emsg, api::json_options(api::compact_json)); }));
    EXPECT_NE(std::string::npos, json.find("\"what\":\"boom\""));
    EXPECT_NE(std::string::npos, json.find("\"name\":\"std::runtime_error\""));
}

TEST(outcome_report_tests, outcome_rendered_as_json)
{
    environment_builder builder;
    builder.set_uri("/report");
    auto result = run(std::move(builder), [](context& ctx) -> int {
        ctx.cleanup().register_action([] { throw std::runtime_error("release failed"); });
        throw std::invalid_argument("no such article");
    });
    ASSERT_TRUE(result.failed());
    
    std::string json;
    ASSERT_TRUE(no_exception([&] { json = api::as_json(result); }));
    EXPECT_NE(std::string::npos, json.find("\"requestId\":\"" + result.request_id() + "\""));
    EXPECT_NE(std::string::npos, json.find("\"kind\":\"HANDLER\""));
    EXPECT_NE(std::string::npos, json.find("\"what\":\"no such article\""));
    EXPECT_NE(std::string::npos, json.find("\"kind\":\"CLEANUP\""));
    EXPECT_NE(std::string::npos, json.find("\"what\":\"release failed\""));
    EXPECT_EQ(std::string::npos, json.find("\"success\""));
}

TEST(outcome_report_tests, describe_and_classify)
{
    auto ep = std::make_exception_ptr(std::invalid_argument("bad"));
    EXPECT_EQ("std::invalid_argument: bad", describe(ep));
    EXPECT_EQ(failure_kind::handler, classify(ep));
    EXPECT_EQ(failure_kind::cancellation, classify(std::make_exception_ptr(operation_cancelled())));
    EXPECT_EQ("no exception", describe(std::exception_ptr()));
    EXPECT_EQ(std::string("operation cancelled"), make_error_code(failure_kind::cancellation).message());
}
