#pragma once

#include <reqctx/runtime/config.hpp>
#include <reqctx/runtime/errors.hpp>
#include <stdexcept>
#include <exception>

namespace reqctx { namespace runtime {

    /// thrown at a suspension point when the surrounding request has been
    /// cancelled or has timed out
    struct operation_cancelled : system_error
    {
        operation_cancelled()
        : system_error(make_error_code(failure_kind::cancellation))
        {}
        
        explicit operation_cancelled(const std::string& what)
        : system_error(make_error_code(failure_kind::cancellation), what)
        {}
    };
    
    /// thrown when an action is registered with, or a drain is requested
    /// of, a cleanup registry whose drain has already begun
    struct registry_closed : std::logic_error
    {
        using std::logic_error::logic_error;
    };

    /// thrown when output is added to a builder whose output has been
    /// finalized
    struct accumulator_finalized : std::logic_error
    {
        using std::logic_error::logic_error;
    };
    
    struct invalid_settings : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    struct missing_handle : std::out_of_range
    {
        using std::out_of_range::out_of_range;
    };

    struct bad_handle_type : std::logic_error
    {
        using std::logic_error::logic_error;
    };

    /// thrown by outcome::get() on a failed outcome. The primary exception
    /// is nested.
    struct execution_failure : system_error
    {
        using system_error::system_error;
    };
    
}}
