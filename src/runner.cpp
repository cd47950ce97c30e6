#include <reqctx/runtime/runner.hpp>
#include <boost/log/trivial.hpp>
#include <valuelib/debug/unwrap.hpp>
#include <cassert>
#include <ostream>
#include <stdexcept>

namespace reqctx { namespace runtime { namespace detail {
    
    execution::execution(environment_ptr env, cancellation_token token)
    : _context(std::move(env), std::move(token))
    , _request_id(_context.get_environment().request_id().str())
    {
        REQCTX_RUNTIME_TRACE_METHOD("execution", __func__);
    }
    
    void execution::start()
    {
        REQCTX_RUNTIME_TRACE_METHOD("execution", __func__);
        if (_state != state_type::created)
            throw std::logic_error("execution::start - execution already started");
        
        _state = state_type::running;
        BOOST_LOG_TRIVIAL(debug) << "execution::start - " << _context;
        
        if (_context.cancelled())
            throw operation_cancelled("request " + _request_id + " cancelled before start");
    }
    
    void execution::fail(std::exception_ptr ep)
    {
        REQCTX_RUNTIME_TRACE_METHOD("execution", __func__);
        assert(ep);
        assert(not _failure);
        auto kind = classify(ep);
        _failure = failure { kind, describe(ep), ep };
        BOOST_LOG_TRIVIAL(debug) << "execution::fail - request " << _request_id
        << " : " << kind << " : " << value::debug::unwrap(ep);
    }
    
    failure_list execution::teardown()
    {
        REQCTX_RUNTIME_TRACE_METHOD("execution", __func__);
        assert(_state == state_type::running or _state == state_type::created);
        
        auto cleanup_failures = registry_access::drain(_context.cleanup());
        
        _state = _failure ? state_type::failed : state_type::completed;
        BOOST_LOG_TRIVIAL(debug) << "execution::teardown - request " << _request_id
        << " : " << _state << ", cleanup failures: " << cleanup_failures.size();
        return cleanup_failures;
    }
    
    std::ostream& operator<<(std::ostream& os, execution::state_type state)
    {
        switch (state)
        {
            case execution::state_type::created: return os << "created";
            case execution::state_type::running: return os << "running";
            case execution::state_type::completed: return os << "completed";
            case execution::state_type::failed: return os << "failed";
        }
        return os << "unknown";
    }
    
    failure environment_failure(std::exception_ptr ep)
    {
        return failure { failure_kind::environment, describe(ep), std::move(ep) };
    }
    
    failure missing_environment()
    {
        BOOST_LOG_TRIVIAL(info) << "run - no environment";
        return environment_failure(std::make_exception_ptr(std::invalid_argument("run: null environment")));
    }
    
    environment_ptr build_environment(environment_builder& builder,
                                      boost::optional<failure>& error)
    {
        try {
            return builder.build();
        }
        catch(...)
        {
            BOOST_LOG_TRIVIAL(info) << "build_environment - " << value::debug::unwrap();
            error = environment_failure(std::current_exception());
            return nullptr;
        }
    }
    
}}}
