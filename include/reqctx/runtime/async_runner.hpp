#pragma once

#include <reqctx/runtime/runner.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <memory>

namespace reqctx { namespace runtime {
    
    /// Runs requests on a dispatch io_service, one independent context per
    /// request.
    ///
    /// Each request may be given a timeout. The deadline timer runs on the
    /// timer io_service; if it expires before the request completes, the
    /// request is cancelled. A handler observes the cancellation at its next
    /// throw_if_cancelled() and the outcome fails with
    /// failure_kind::cancellation. The cleanup registry is drained regardless.
    ///
    /// The completion handler is invoked on the dispatch io_service with the
    /// outcome. Wrap it with another io_service's wrap() to receive it there.
    class async_runner
    {
    public:
        using clock_type = std::chrono::steady_clock;
        using duration = clock_type::duration;
        
        explicit async_runner(asio::io_service& dispatch_service)
        : async_runner(dispatch_service, dispatch_service)
        {}
        
        async_runner(asio::io_service& dispatch_service, asio::io_service& timer_service)
        : _dispatch_service(dispatch_service)
        , _timer_service(timer_service)
        {}
        
        asio::io_service& get_io_service() { return _dispatch_service; }
        
        /// Queue a request.
        /// @returns the source which cancels the request, e.g. when the client
        ///          disconnects
        template<class Handler, class CompletionHandler>
        cancellation_source async_run(environment_builder builder,
                                      Handler&& handler,
                                      CompletionHandler&& completion)
        {
            return async_run_impl(std::move(builder),
                                  boost::none,
                                  std::forward<Handler>(handler),
                                  std::forward<CompletionHandler>(completion));
        }
        
        /// Queue a request which is cancelled if it has not completed within
        /// `timeout` of this call.
        template<class Handler, class CompletionHandler>
        cancellation_source async_run(environment_builder builder,
                                      duration timeout,
                                      Handler&& handler,
                                      CompletionHandler&& completion)
        {
            return async_run_impl(std::move(builder),
                                  timeout,
                                  std::forward<Handler>(handler),
                                  std::forward<CompletionHandler>(completion));
        }
        
    private:
        template<class Handler, class CompletionHandler>
        cancellation_source async_run_impl(environment_builder builder,
                                           boost::optional<duration> timeout,
                                           Handler&& handler,
                                           CompletionHandler&& completion);
        
        asio::io_service& _dispatch_service;
        asio::io_service& _timer_service;
    };
    
    template<class Handler, class CompletionHandler>
    cancellation_source
    async_runner::async_run_impl(environment_builder builder,
                                 boost::optional<duration> timeout,
                                 Handler&& handler,
                                 CompletionHandler&& completion)
    {
        REQCTX_RUNTIME_TRACE_METHOD("async_runner", __func__);
        using handler_type = std::decay_t<Handler>;
        using completion_type = std::decay_t<CompletionHandler>;
        
        cancellation_source source;
        
        std::shared_ptr<asio::steady_timer> timer;
        if (timeout)
        {
            timer = std::make_shared<asio::steady_timer>(_timer_service, *timeout);
            timer->async_wait([source](const error_code& ec) mutable
                              {
                                  if (not ec and source.cancel())
                                  {
                                      BOOST_LOG_TRIVIAL(info) << "async_runner - request timed out";
                                  }
                              });
        }
        
        auto shared_builder = std::make_shared<environment_builder>(std::move(builder));
        _dispatch_service.post([source,
                                timer,
                                shared_builder,
                                handler = handler_type(std::forward<Handler>(handler)),
                                completion = completion_type(std::forward<CompletionHandler>(completion))]
                               () mutable
                               {
                                   auto result = run(std::move(*shared_builder),
                                                     handler,
                                                     source.token());
                                   if (timer)
                                   {
                                       error_code sink;
                                       timer->cancel(sink);
                                   }
                                   completion(std::move(result));
                               });
        return source;
    }
    
}}
