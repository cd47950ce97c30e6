#pragma once

#include <reqctx/runtime/context.hpp>
#include <reqctx/runtime/builder_context.hpp>
#include <reqctx/runtime/outcome.hpp>
#include <boost/optional.hpp>
#include <type_traits>
#include <utility>

namespace reqctx { namespace runtime {
    
    template<class Handler>
    using handler_result_t = std::decay_t<std::result_of_t<Handler&(context&)>>;
    
    template<class Builder>
    using builder_result_t = std::decay_t<std::result_of_t<Builder&(builder_context&)>>;
    
    namespace detail {
        
        /// One run of a handler against a fresh context.
        ///
        /// created -> running -> { completed | failed }
        ///
        /// The cleanup registry is drained on the way into either terminal
        /// state.
        struct execution
        {
            enum class state_type {
                created,
                running,
                completed,
                failed
            };
            
            execution(environment_ptr env, cancellation_token token);
            
            execution(const execution&) = delete;
            execution& operator=(const execution&) = delete;
            
            context& get_context() { return _context; }
            const std::string& request_id() const { return _request_id; }
            state_type state() const { return _state; }
            
            /// created -> running
            /// @throws operation_cancelled if cancelled before the handler starts
            void start();
            
            /// record the exception which escaped the handler
            void fail(std::exception_ptr ep);
            
            /// drain the cleanup registry and move to the terminal state
            failure_list teardown();
            
            failure take_failure() { return std::move(*_failure); }
            bool has_failed() const { return bool(_failure); }
            
        private:
            context _context;
            std::string _request_id;
            state_type _state = state_type::created;
            boost::optional<failure> _failure;
        };
        
        std::ostream& operator<<(std::ostream& os, execution::state_type state);
        
        template<class Result>
        struct handler_invoke
        {
            template<class Handler>
            static outcome<Result> invoke(execution& exec, Handler& handler)
            {
                boost::optional<Result> result;
                try {
                    exec.start();
                    result.emplace(handler(exec.get_context()));
                }
                catch(...)
                {
                    exec.fail(std::current_exception());
                }
                
                auto cleanup_failures = exec.teardown();
                if (exec.has_failed())
                    return outcome<Result>::make_failed(exec.request_id(),
                                                   exec.take_failure(),
                                                   std::move(cleanup_failures));
                return outcome<Result>::success(exec.request_id(),
                                                std::move(*result),
                                                std::move(cleanup_failures));
            }
        };
        
        template<>
        struct handler_invoke<void>
        {
            template<class Handler>
            static outcome<void> invoke(execution& exec, Handler& handler)
            {
                try {
                    exec.start();
                    handler(exec.get_context());
                }
                catch(...)
                {
                    exec.fail(std::current_exception());
                }
                
                auto cleanup_failures = exec.teardown();
                if (exec.has_failed())
                    return outcome<void>::make_failed(exec.request_id(),
                                                 exec.take_failure(),
                                                 std::move(cleanup_failures));
                return outcome<void>::success(exec.request_id(),
                                              std::move(cleanup_failures));
            }
        };
        
        /// the failure of an environment which could not be built
        failure environment_failure(std::exception_ptr ep);
        
        /// the failure of a run given no environment
        failure missing_environment();
        
        /// build the environment, or return the reason it could not be built
        environment_ptr build_environment(environment_builder& builder,
                                          boost::optional<failure>& error);
        
        template<class Builder>
        struct builder_handler
        {
            using result_type = builder_result_t<Builder>;
            
            built_type<result_type> operator()(context& ctx)
            {
                builder_context builder(ctx);
                return builder_invoke<result_type>::invoke(builder, _builder);
            }
            
            Builder& _builder;
        };
    }
    
    /// Run handler(context&) against a new context over `env`.
    /// The context's cleanup registry is drained whether the handler returns
    /// or throws. A null `env` fails with failure_kind::environment and the
    /// handler does not run.
    template<class Handler>
    auto run(environment_ptr env, Handler&& handler, cancellation_token token = {})
    -> outcome<handler_result_t<Handler>>
    {
        using result_type = handler_result_t<Handler>;
        if (not env)
            return outcome<result_type>::make_failed(std::string(), detail::missing_environment());
        detail::execution exec(std::move(env), std::move(token));
        return detail::handler_invoke<result_type>::invoke(exec, handler);
    }
    
    /// Build the environment and run handler(context&) against it.
    /// If the environment cannot be built the handler does not run and the
    /// outcome fails with failure_kind::environment.
    template<class Handler>
    auto run(environment_builder builder, Handler&& handler, cancellation_token token = {})
    -> outcome<handler_result_t<Handler>>
    {
        using result_type = handler_result_t<Handler>;
        boost::optional<failure> error;
        auto env = detail::build_environment(builder, error);
        if (not env)
            return outcome<result_type>::make_failed(std::string(), std::move(*error));
        return run(std::move(env), std::forward<Handler>(handler), std::move(token));
    }
    
    /// Run builder(builder_context&) against a new context, accumulating output.
    /// @returns the finalized output, paired with the builder's result if it
    ///          has one
    template<class EnvironmentSource, class Builder,
    std::enable_if_t< not std::is_base_of<capabilities, std::decay_t<EnvironmentSource>>::value >* = nullptr>
    auto run_builder(EnvironmentSource&& source, Builder&& builder, cancellation_token token = {})
    -> outcome<built_type<builder_result_t<Builder>>>
    {
        return run(std::forward<EnvironmentSource>(source),
                   detail::builder_handler<std::remove_reference_t<Builder>> { builder },
                   std::move(token));
    }
    
    /// Run builder(builder_context&) over an existing context.
    /// No teardown happens here: the cleanup registry belongs to the
    /// execution which owns `ctx`, so the outcome carries no cleanup failures.
    template<class Builder>
    auto run_builder(context& ctx, Builder&& builder)
    -> outcome<built_type<builder_result_t<Builder>>>
    {
        using result_type = built_type<builder_result_t<Builder>>;
        auto& request_id = ctx.get_environment().metadata().request_id();
        try {
            auto handler = detail::builder_handler<std::remove_reference_t<Builder>> { builder };
            return outcome<result_type>::success(request_id, handler(ctx));
        }
        catch(...)
        {
            auto ep = std::current_exception();
            return outcome<result_type>::make_failed(request_id,
                                                failure { classify(ep), describe(ep), ep });
        }
    }
    
}}
