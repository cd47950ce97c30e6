#pragma once

#include <reqctx/runtime/config.hpp>
#include <reqctx/runtime/exception.hpp>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace reqctx { namespace runtime {
    
    class cleanup_registry;
    
    namespace detail {
        /// the owner's view of a registry. Only the execution which owns a
        /// context (and the registry tests) drain it.
        struct registry_access;
    }
    
    /// identifies one registered cleanup action so that it may be cancelled
    struct cleanup_token
    {
        using value_type = std::uint64_t;
        
        constexpr cleanup_token() : _value(0) {}
        explicit constexpr cleanup_token(value_type value) : _value(value) {}
        
        constexpr value_type value() const { return _value; }
        constexpr explicit operator bool() const { return _value != 0; }
        
        friend constexpr bool operator==(cleanup_token l, cleanup_token r) { return l._value == r._value; }
        friend constexpr bool operator!=(cleanup_token l, cleanup_token r) { return l._value != r._value; }
        
    private:
        value_type _value;
    };
    
    /// An ordered list of cleanup actions, each invoked exactly once when the
    /// owning context is torn down.
    ///
    /// A registry has three states:
    /// * open: actions may be registered and cancelled
    /// * draining: actions are being invoked, most recently registered first.
    ///   registration is rejected and cancel() returns false.
    /// * drained: terminal. registration and a further drain are rejected.
    ///
    /// An exception thrown by an action does not prevent the remaining
    /// actions from running. All such exceptions are returned by drain().
    ///
    /// drain() belongs to the owner of the registry. Handlers which reach the
    /// registry through a context may register and cancel, never drain.
    class cleanup_registry
    {
    public:
        using action_type = std::function<void()>;
        using failure_list = std::vector<std::exception_ptr>;
        
        cleanup_registry() = default;
        cleanup_registry(const cleanup_registry&) = delete;
        cleanup_registry& operator=(const cleanup_registry&) = delete;
        
        /// if the registry was never drained, drain it now and log each failure
        ~cleanup_registry() noexcept;
        
        /// @throws registry_closed if drain has begun
        cleanup_token register_action(action_type action);
        
        /// @returns true if the action was still pending and is now removed
        bool cancel(cleanup_token token);
        
        std::size_t pending() const { return _actions.size(); }
        bool draining() const { return _state == state::draining; }
        bool drained() const { return _state == state::drained; }
        bool open() const { return _state == state::open; }

    private:
        friend struct detail::registry_access;
        
        /// invoke every pending action in reverse registration order
        /// @returns the exceptions thrown by actions, in invocation order
        /// @throws registry_closed if called a second time
        failure_list drain();
        
        enum class state {
            open,
            draining,
            drained
        };
        
        struct entry
        {
            cleanup_token token;
            action_type action;
        };
        
        state _state = state::open;
        cleanup_token::value_type _next_token = 1;
        std::vector<entry> _actions;
    };
    
    namespace detail {
        struct registry_access
        {
            static cleanup_registry::failure_list drain(cleanup_registry& registry)
            {
                return registry.drain();
            }
        };
    }
    
    /// Registers an action on construction. Leaving scope with the guard
    /// armed cancels the registration and runs the action at once. release()
    /// cancels the registration without running it.
    ///
    ///     scoped_cleanup undo(ctx.cleanup(), [&] { db.rollback(); });
    ///     db.write(...);
    ///     undo.release();
    ///
    /// An exception thrown by the action when leaving scope is handed back to
    /// the registry, to be reported with the other cleanup failures.
    /// Once the registry has begun to drain the action belongs to the
    /// registry, and the guard neither runs nor cancels it.
    class scoped_cleanup
    {
    public:
        using action_type = cleanup_registry::action_type;
        
        /// @throws registry_closed if the registry's drain has begun
        scoped_cleanup(cleanup_registry& registry, action_type action)
        : _registry(std::addressof(registry))
        , _action(std::make_shared<action_type>(std::move(action)))
        {
            auto action_ptr = _action;
            _token = registry.register_action([action_ptr] { (*action_ptr)(); });
        }
        
        scoped_cleanup(scoped_cleanup&& other) noexcept
        : _registry(other._registry)
        , _action(std::move(other._action))
        , _token(other._token)
        {
            other._registry = nullptr;
            other._token = cleanup_token();
        }
        
        scoped_cleanup(const scoped_cleanup&) = delete;
        scoped_cleanup& operator=(const scoped_cleanup&) = delete;
        scoped_cleanup& operator=(scoped_cleanup&&) = delete;
        
        /// if armed, cancel the registration and run the action now
        ~scoped_cleanup() noexcept;
        
        /// disarm: the action will run neither here nor at teardown
        /// @returns true if the action was still pending
        bool release();
        
        bool armed() const { return _registry and bool(_token); }
        cleanup_token token() const { return _token; }
        
    private:
        cleanup_registry* _registry;
        std::shared_ptr<action_type> _action;
        cleanup_token _token;
    };
    
    /// Register `release(resource)` as a cleanup action and return the
    /// resource. Used to pair a checkout with its release.
    template<class Resource, class Release>
    Resource& acquire(cleanup_registry& registry, Resource& resource, Release&& release)
    {
        registry.register_action([&resource, release = std::forward<Release>(release)]() mutable {
            release(resource);
        });
        return resource;
    }
    
    template<class Resource, class Release>
    std::shared_ptr<Resource> acquire_shared(cleanup_registry& registry,
                                             std::shared_ptr<Resource> resource,
                                             Release&& release)
    {
        registry.register_action([resource, release = std::forward<Release>(release)]() mutable {
            release(*resource);
        });
        return resource;
    }
    
}}
