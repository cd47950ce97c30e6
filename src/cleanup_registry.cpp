#include <reqctx/runtime/cleanup_registry.hpp>
#include <boost/log/trivial.hpp>
#include <valuelib/debug/demangle.hpp>
#include <valuelib/debug/unwrap.hpp>
#include <algorithm>

namespace reqctx { namespace runtime {
    
    cleanup_registry::~cleanup_registry() noexcept
    {
        if (_state != state::open)
            return;
        
        try {
            auto abandoned = _actions.size();
            auto failures = drain();
            if (abandoned)
            {
                BOOST_LOG_TRIVIAL(warning)
                << value::debug::demangle<cleanup_registry>() << "::" << __func__
                << " : registry destroyed without drain. ran " << abandoned << " action(s)";
            }
            for (auto& ep : failures)
            {
                BOOST_LOG_TRIVIAL(warning)
                << value::debug::demangle<cleanup_registry>() << "::" << __func__
                << " : cleanup failure : " << value::debug::unwrap(ep);
            }
        }
        catch(...)
        {
            BOOST_LOG_TRIVIAL(warning)
            << value::debug::demangle<cleanup_registry>() << "::" << __func__
            << " : exception : " << value::debug::unwrap();
        }
    }
    
    cleanup_token cleanup_registry::register_action(action_type action)
    {
        REQCTX_RUNTIME_TRACE_METHOD("cleanup_registry", __func__);
        switch (_state)
        {
            case state::open:
                break;
            case state::draining:
                throw registry_closed("cleanup_registry: registration during drain");
            case state::drained:
                throw registry_closed("cleanup_registry: registration after drain");
        }
        
        auto token = cleanup_token(_next_token++);
        _actions.push_back(entry { token, std::move(action) });
        return token;
    }
    
    bool cleanup_registry::cancel(cleanup_token token)
    {
        REQCTX_RUNTIME_TRACE_METHOD("cleanup_registry", __func__);
        if (_state != state::open)
            return false;
        
        auto ifind = std::find_if(_actions.begin(), _actions.end(),
                                  [token](const entry& e) { return e.token == token; });
        if (ifind == _actions.end())
            return false;
        _actions.erase(ifind);
        return true;
    }
    
    auto cleanup_registry::drain() -> failure_list
    {
        REQCTX_RUNTIME_TRACE_METHOD("cleanup_registry", __func__);
        if (_state != state::open)
            throw registry_closed("cleanup_registry: drain called more than once");
        
        _state = state::draining;
        
        // take ownership of the actions so that each runs exactly once
        // whatever the actions themselves try to do to the registry
        auto actions = std::move(_actions);
        _actions.clear();
        
        failure_list failures;
        for (auto i = actions.rbegin() ; i != actions.rend() ; ++i)
        {
            try {
                i->action();
            }
            catch(...)
            {
                BOOST_LOG_TRIVIAL(warning)
                << "cleanup_registry::drain - action " << i->token.value()
                << " failed : " << value::debug::unwrap();
                failures.push_back(std::current_exception());
            }
        }
        
        _state = state::drained;
        return failures;
    }
    
    scoped_cleanup::~scoped_cleanup() noexcept
    {
        if (not armed() or not _registry->cancel(_token))
            return;
        
        try {
            (*_action)();
        }
        catch(...)
        {
            // the registry is still open: report the failure at teardown
            auto ep = std::current_exception();
            BOOST_LOG_TRIVIAL(info)
            << value::debug::demangle<scoped_cleanup>() << "::" << __func__
            << " : action " << _token.value() << " failed : " << value::debug::unwrap(ep);
            try {
                _registry->register_action([ep] { std::rethrow_exception(ep); });
            }
            catch(...)
            {
                BOOST_LOG_TRIVIAL(warning)
                << value::debug::demangle<scoped_cleanup>() << "::" << __func__
                << " : exception : " << value::debug::unwrap();
            }
        }
    }
    
    bool scoped_cleanup::release()
    {
        REQCTX_RUNTIME_TRACE_METHOD("scoped_cleanup", __func__);
        if (not armed())
            return false;
        
        auto cancelled = _registry->cancel(_token);
        _registry = nullptr;
        _token = cleanup_token();
        return cancelled;
    }
    
}}
