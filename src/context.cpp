#include <reqctx/runtime/context.hpp>
#include <reqctx/runtime/exception.hpp>
#include <ostream>
#include <stdexcept>

namespace reqctx { namespace runtime {
    
    void capabilities::throw_if_cancelled() const
    {
        if (cancelled())
            throw operation_cancelled("request " + get_environment().request_id().str() + " cancelled");
    }
    
    context::context(environment_ptr env, cancellation_token cancellation)
    : _environment(std::move(env))
    , _cancellation(std::move(cancellation))
    {
        if (not _environment)
            throw std::invalid_argument("context: null environment");
    }
    
    std::ostream& operator<<(std::ostream&os, const context& ctx)
    {
        return os << *ctx._environment
        << ", state entries: " << ctx._state.size()
        << ", pending cleanups: " << ctx._cleanup.pending();
    }
    
}}
