#include <reqctx/runtime/outcome.hpp>
#include <valuelib/debug/demangle.hpp>
#include <cassert>
#include <typeinfo>

namespace reqctx { namespace runtime {
    
    const failure& outcome_base::get_failure() const
    {
        assert(_failure);
        return *_failure;
    }
    
    error_code outcome_base::code() const
    {
        if (_failure)
            return make_error_code(_failure->kind);
        return error_code();
    }
    
    void outcome_base::rethrow_if_failed() const
    {
        if (not _failure)
            return;
        
        if (not _failure->exception)
            throw execution_failure(make_error_code(_failure->kind), _failure->message);
        
        try {
            std::rethrow_exception(_failure->exception);
        }
        catch(...)
        {
            std::throw_with_nested(execution_failure(make_error_code(_failure->kind),
                                                     _failure->message));
        }
    }
    
    std::string describe(const std::exception_ptr& ep)
    {
        if (not ep)
            return "no exception";
        
        try {
            std::rethrow_exception(ep);
        }
        catch(const std::exception& e)
        {
            return value::debug::demangle(typeid(e)) + ": " + e.what();
        }
        catch(const char* text)
        {
            return text;
        }
        catch(...)
        {
            return "unknown error";
        }
    }
    
    failure_kind classify(const std::exception_ptr& ep)
    {
        if (not ep)
            return failure_kind::handler;
        
        try {
            std::rethrow_exception(ep);
        }
        catch(const operation_cancelled&)
        {
            return failure_kind::cancellation;
        }
        catch(const system_error& e)
        {
            if (e.code() == make_error_condition(failure_kind::cancellation)
                or e.code() == asio::error::operation_aborted)
                return failure_kind::cancellation;
            return failure_kind::handler;
        }
        catch(...)
        {
            return failure_kind::handler;
        }
    }
    
}}
