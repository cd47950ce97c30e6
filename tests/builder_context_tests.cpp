#include <gtest/gtest.h>
#include "test_utils.hpp"
#include <reqctx/runtime/runner.hpp>
#include <type_traits>

using namespace reqctx::runtime;

namespace {
    
    /// a collaborator written once against the capability interface
    void remember_visit(capabilities& caps, call_log& log)
    {
        caps.state().write("visited", caps.get_environment().metadata().uri());
        caps.cleanup().register_action(log.record("visit released"));
    }
    
    environment_builder page_request()
    {
        environment_builder builder;
        builder.set_method("GET").set_uri("/page");
        return builder;
    }
    
    template<class T, class = void>
    struct has_public_finish : std::false_type {};
    
    template<class T>
    struct has_public_finish<T, decltype(void(std::declval<T&>().finish()))> : std::true_type {};
}

static_assert(not has_public_finish<builder_context>::value,
              "a builder's output is finalized only when the builder returns");

TEST(builder_context_tests, fragments_keep_order_and_handler_writes_survive)
{
    boost::optional<int> x_after;
    
    auto result = run(page_request(), [&](context& ctx) {
        auto built = run_builder(ctx, [](builder_context& b) {
            b.append("<p>");
            b.run_as_handler([](context& ctx) {
                ctx.state().write("x", 1);
            });
            b.append("</p>");
        });
        x_after = ctx.state().read_as<int>("x");
        return std::move(built).get();
    });
    
    ASSERT_TRUE(result.succeeded()) << result.get_failure().message;
    auto& output = result.value();
    EXPECT_EQ((std::vector<std::string> { "<p>", "</p>" }), output.fragments());
    EXPECT_TRUE(output.finalized());
    ASSERT_TRUE(x_after);
    EXPECT_EQ(1, *x_after);
}

TEST(builder_context_tests, run_as_handler_twice_observes_first_write)
{
    auto result = run_builder(page_request(), [](builder_context& b) {
        b.run_as_handler([](context& ctx) {
            ctx.state().write("count", 1);
        });
        return b.run_as_handler([](context& ctx) {
            return ctx.state().read_as<int>("count").value_or(0);
        });
    });
    
    ASSERT_TRUE(result.succeeded()) << result.get_failure().message;
    EXPECT_EQ(1, result.value().first);
    EXPECT_TRUE(result.value().second.empty());
}

TEST(builder_context_tests, nested_builder_shares_state)
{
    auto result = run_builder(page_request(), [](builder_context& outer) {
        outer.append("<div>");
        auto inner_output = outer.run_builder([](builder_context& inner) {
            inner.append("<span>");
            inner.state().write("nested", std::string("yes"));
            inner.merge_metadata({ "stylesheet", "/site.css" });
        });
        
        EXPECT_EQ("yes", outer.state().read_as<std::string>("nested").value());
        EXPECT_TRUE(inner_output.finalized());
        EXPECT_EQ((std::vector<std::string> { "<span>" }), inner_output.fragments());
        
        // nested output is not merged until asked
        EXPECT_EQ((std::vector<std::string> { "<div>" }), outer.output().fragments());
        outer.merge(inner_output);
        outer.append("</div>");
    });
    
    ASSERT_TRUE(result.succeeded()) << result.get_failure().message;
    EXPECT_EQ("<div><span></div>", result.value().str());
    EXPECT_EQ(1, result.value().metadata().size());
}

TEST(builder_context_tests, nested_builder_returns_value_and_output)
{
    auto result = run_builder(page_request(), [](builder_context& outer) {
        auto inner = outer.run_builder([](builder_context& b) {
            b.append("42");
            return 42;
        });
        EXPECT_EQ(42, inner.first);
        EXPECT_EQ("42", inner.second.str());
        outer.merge(inner.second);
    });
    
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ("42", result.value().str());
}

TEST(builder_context_tests, metadata_is_deduplicated)
{
    auto result = run_builder(page_request(), [](builder_context& b) {
        EXPECT_TRUE(b.merge_metadata({ "script", "/app.js" }));
        EXPECT_FALSE(b.merge_metadata({ "script", "/app.js" }));
        EXPECT_TRUE(b.merge_metadata({ "stylesheet", "/app.js" }));
        EXPECT_TRUE(b.merge_metadata({ "script", "/vendor.js" }));
    });
    
    ASSERT_TRUE(result.succeeded());
    auto& metadata = result.value().metadata();
    EXPECT_EQ(3, metadata.size());
    EXPECT_EQ(1, metadata.count(metadata_entry { "script", "/app.js" }));
}

TEST(builder_context_tests, finalized_output_rejects_appends)
{
    output_accumulator acc;
    acc.append("a");
    acc.finalize();
    EXPECT_TRUE(throws<accumulator_finalized>([&] { acc.append("b"); }));
    EXPECT_TRUE(throws<accumulator_finalized>([&] { acc.merge_metadata({ "script", "x" }); }));
    EXPECT_TRUE(throws<accumulator_finalized>([&] { acc.merge(output_accumulator()); }));
    EXPECT_EQ("a", acc.str());
}

TEST(builder_context_tests, collaborator_works_in_both_modes)
{
    call_log log;
    
    auto result = run(page_request(), [&](context& ctx) {
        remember_visit(ctx, log);
        auto built = run_builder(ctx, [&](builder_context& b) {
            remember_visit(b, log);
            b.append(b.state().read_as<std::string>("visited").value());
        });
        return std::move(built).get().str();
    });
    
    ASSERT_TRUE(result.succeeded()) << result.get_failure().message;
    EXPECT_EQ("/page", result.value());
    EXPECT_EQ(2, log.count("visit released"));
}

TEST(builder_context_tests, builder_failure_on_existing_context_is_not_teardown)
{
    call_log log;
    
    auto result = run(page_request(), [&](context& ctx) {
        auto built = run_builder(ctx, [&](builder_context& b) {
            b.cleanup().register_action(log.record("cleanup"));
            b.state().write("before_failure", true);
            throw std::runtime_error("template error");
        });
        
        EXPECT_TRUE(built.failed());
        EXPECT_EQ(failure_kind::handler, built.get_failure().kind);
        EXPECT_TRUE(built.cleanup_failures().empty());
        
        // not drained yet: the enclosing execution owns the registry
        EXPECT_EQ(0, log.count("cleanup"));
        EXPECT_EQ(1, ctx.cleanup().pending());
        return ctx.state().read_as<bool>("before_failure").value();
    });
    
    ASSERT_TRUE(result.succeeded());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(1, log.count("cleanup"));
}

TEST(builder_context_tests, output_seen_by_the_builder_is_the_output_returned)
{
    std::size_t seen = 0;
    auto result = run_builder(page_request(), [&](builder_context& b) {
        b.append("<p>");
        b.append("</p>");
        seen = b.output().fragments().size();
        EXPECT_FALSE(b.output().finalized());
    });
    
    ASSERT_TRUE(result.succeeded()) << result.get_failure().message;
    EXPECT_EQ(2, seen);
    EXPECT_EQ(2, result.value().fragments().size());
    EXPECT_EQ("<p></p>", result.value().str());
    EXPECT_TRUE(result.value().finalized());
}
