#pragma once

#include <reqctx/runtime/config.hpp>
#include <reqctx/runtime/identifiers.hpp>
#include <reqctx/runtime/exception.hpp>
#include <reqctx/runtime/environment.pb.h>
#include <google/protobuf/arena.h>
#include <boost/any.hpp>
#include <boost/optional.hpp>
#include <valuelib/debug/demangle.hpp>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>

namespace reqctx { namespace runtime {
    
    /// The immutable, request-scoped environment.
    /// An environment is created once per request by an environment_builder
    /// and shared by reference-counted pointer to const for the lifetime of
    /// the request. There are no mutators.
    struct environment
    {
        using Arena = google::protobuf::Arena;
        using handle_map = std::map<std::string, boost::any>;
        
        const runtime::request_id& request_id() const { return _id; }
        
        const RequestMetadata& metadata() const { return *_metadata; }
        
        const Settings& settings() const { return *_settings; }
        
        boost::optional<std::string> setting(const std::string& name) const;
        std::string setting_or(const std::string& name, std::string fallback) const;
        
        /// first header whose name matches, ignoring case
        const Header* find_header(const std::string& name) const;
        
        /// return the shared handle registered under `name`
        /// @throws missing_handle if there is no such handle
        /// @throws bad_handle_type if the handle is not a std::shared_ptr<T>
        template<class T>
        std::shared_ptr<T> handle(const std::string& name) const
        {
            auto ifind = _handles.find(name);
            if (ifind == _handles.end())
                throw missing_handle("no environment handle named: " + name);
            auto p = boost::any_cast<std::shared_ptr<T>>(std::addressof(ifind->second));
            if (not p)
                throw bad_handle_type("environment handle " + name + " is not a "
                                      + value::debug::demangle<std::shared_ptr<T>>());
            return *p;
        }
        
        /// @returns the handle, or nullptr if absent or of another type
        template<class T>
        std::shared_ptr<T> find_handle(const std::string& name) const
        {
            auto ifind = _handles.find(name);
            if (ifind == _handles.end())
                return nullptr;
            auto p = boost::any_cast<std::shared_ptr<T>>(std::addressof(ifind->second));
            return p ? *p : nullptr;
        }
        
        bool has_handle(const std::string& name) const {
            return _handles.count(name) != 0;
        }
        
        environment(const environment&) = delete;
        environment& operator=(const environment&) = delete;
        
    private:
        friend struct environment_builder;
        environment();
        
        Arena _arena;
        runtime::request_id _id { runtime::request_id::generate };
        RequestMetadata* _metadata;
        Settings* _settings;
        handle_map _handles;
    };
    
    using environment_ptr = std::shared_ptr<const environment>;
    
    /// Collects the data of one inbound request and builds its environment.
    /// build() may only be called once.
    struct environment_builder
    {
        environment_builder();
        environment_builder(environment_builder&&) = default;
        environment_builder& operator=(environment_builder&&) = default;
        environment_builder(const environment_builder&) = delete;
        environment_builder& operator=(const environment_builder&) = delete;
        
        environment_builder& set_method(std::string method);
        environment_builder& set_uri(std::string uri);
        environment_builder& add_header(std::string name, std::string value);
        environment_builder& set_remote_address(std::string address);
        
        environment_builder& set_setting(const std::string& name, std::string value);
        
        /// merge settings from a json object of the form
        /// { "values": { "name": "value", ... } }
        /// @throws invalid_settings if the text cannot be parsed
        environment_builder& load_settings_json(const std::string& json);
        
        template<class T>
        environment_builder& add_handle(const std::string& name, std::shared_ptr<T> handle)
        {
            mutable_env()._handles[name] = std::move(handle);
            return *this;
        }
        
        /// @throws std::logic_error if called a second time
        environment_ptr build();
        
    private:
        environment& mutable_env();
        
        std::shared_ptr<environment> _env;
    };
    
    std::ostream& operator<<(std::ostream& os, const environment& env);
    
}}
