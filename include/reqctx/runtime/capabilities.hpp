#pragma once

#include <reqctx/runtime/environment.hpp>
#include <reqctx/runtime/state_cell.hpp>
#include <reqctx/runtime/cleanup_registry.hpp>
#include <reqctx/runtime/cancellation.hpp>

namespace reqctx { namespace runtime {
    
    /// The capability set available to any code running on behalf of a
    /// request. Both a plain context and a builder_context provide it, so a
    /// collaborator written against capabilities& may be called from either
    /// without conversion.
    struct capabilities
    {
        virtual const environment& get_environment() const = 0;
        virtual state_cell& state() = 0;
        virtual cleanup_registry& cleanup() = 0;
        virtual const cancellation_token& cancellation() const = 0;
        
        bool cancelled() const {
            return cancellation().cancelled();
        }
        
        /// call at suspension points
        /// @throws operation_cancelled
        void throw_if_cancelled() const;
        
    protected:
        ~capabilities() = default;
    };
    
}}
