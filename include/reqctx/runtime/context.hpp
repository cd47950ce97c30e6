#pragma once

#include <reqctx/runtime/capabilities.hpp>

namespace reqctx { namespace runtime {
    
    namespace detail { struct execution; }
    
    /// The unit of execution for a handler: the environment (shared), the
    /// state cell and the cleanup registry (both owned).
    /// Only the runner creates and tears down a context. Handlers receive it
    /// by reference.
    class context final : public capabilities
    {
    public:
        const environment& get_environment() const override { return *_environment; }
        state_cell& state() override { return _state; }
        cleanup_registry& cleanup() override { return _cleanup; }
        const cancellation_token& cancellation() const override { return _cancellation; }
        
        const environment_ptr& shared_environment() const { return _environment; }
        
        context(const context&) = delete;
        context& operator=(const context&) = delete;
        
    private:
        friend struct detail::execution;
        
        context(environment_ptr env, cancellation_token cancellation);
        
        environment_ptr _environment;
        state_cell _state;
        cleanup_registry _cleanup;
        cancellation_token _cancellation;
        
        /// emit debug info
        friend std::ostream& operator<<(std::ostream&os, const context& ctx);
    };
    
}}
