#pragma once
#include <reqctx/runtime/config.hpp>
#include <iosfwd>

namespace reqctx { namespace runtime {

    /// The kind of failure which terminated an execution.
    /// Values start at 1 so that a default-constructed error_code means
    /// "no failure".
    enum class failure_kind
    {
        handler = 1,
        cleanup,
        cancellation,
        environment,
    };

    const error_category& failure_category();
    error_code make_error_code(failure_kind kind);
    error_condition make_error_condition(failure_kind kind);
    
    const char* to_string(failure_kind kind);
    std::ostream& operator<<(std::ostream& os, failure_kind kind);

}}

namespace boost { namespace system {
    template<>
    struct is_error_code_enum<reqctx::runtime::failure_kind>
    : std::true_type {};
    
    template<>
    struct is_error_condition_enum<reqctx::runtime::failure_kind>
    : std::true_type {};
}}
