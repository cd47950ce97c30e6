#pragma once

#include <reqctx/runtime/config.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace reqctx { namespace runtime {
    
    namespace detail {
        struct cancellation_state
        {
            std::atomic<bool> cancelled { false };
        };
    }
    
    /// Observes the cancellation state of one request.
    /// A default-constructed token is never cancelled.
    struct cancellation_token
    {
        cancellation_token() = default;
        
        bool cancelled() const {
            return _state and _state->cancelled.load();
        }
        
    private:
        friend struct cancellation_source;
        explicit cancellation_token(std::shared_ptr<detail::cancellation_state> state)
        : _state(std::move(state))
        {}
        
        std::shared_ptr<detail::cancellation_state> _state;
    };
    
    /// Held by whoever may cancel a request: the transport on client
    /// disconnect, or a deadline timer.
    /// cancel() may be called from any thread.
    struct cancellation_source
    {
        cancellation_source()
        : _state(std::make_shared<detail::cancellation_state>())
        {}
        
        cancellation_token token() const {
            return cancellation_token(_state);
        }
        
        /// @returns true if this call performed the cancellation
        bool cancel() {
            bool expected = false;
            return _state->cancelled.compare_exchange_strong(expected, true);
        }
        
        bool cancelled() const {
            return _state->cancelled.load();
        }
        
    private:
        std::shared_ptr<detail::cancellation_state> _state;
    };
    
}}
