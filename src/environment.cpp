#include <reqctx/runtime/environment.hpp>
#include <google/protobuf/util/json_util.h>
#include <boost/algorithm/string.hpp>
#include <boost/log/trivial.hpp>
#include <sstream>
#include <stdexcept>

namespace reqctx { namespace runtime {
    
    constexpr self_generating_uuid::generate_type self_generating_uuid::generate;
    
    environment::environment()
    : _metadata(Arena::CreateMessage<RequestMetadata>(std::addressof(_arena)))
    , _settings(Arena::CreateMessage<Settings>(std::addressof(_arena)))
    {
        _metadata->set_request_id(_id.str());
    }
    
    boost::optional<std::string> environment::setting(const std::string& name) const
    {
        auto& values = _settings->values();
        auto ifind = values.find(name);
        if (ifind == values.end())
            return boost::none;
        return ifind->second;
    }
    
    std::string environment::setting_or(const std::string& name, std::string fallback) const
    {
        auto result = setting(name);
        if (result)
            return std::move(*result);
        return fallback;
    }
    
    const Header* environment::find_header(const std::string& name) const
    {
        for (auto& header : _metadata->headers())
        {
            if (boost::iequals(header.name(), name))
                return std::addressof(header);
        }
        return nullptr;
    }
    
    std::ostream& operator<<(std::ostream& os, const environment& env)
    {
        auto& md = env.metadata();
        return os << "request: " << env.request_id()
        << ", " << md.method() << " " << md.uri();
    }
    
    //
    // environment_builder
    //
    
    environment_builder::environment_builder()
    : _env(new environment())
    {}
    
    environment& environment_builder::mutable_env()
    {
        if (not _env)
            throw std::logic_error("environment_builder: environment already built");
        return *_env;
    }
    
    environment_builder& environment_builder::set_method(std::string method)
    {
        mutable_env()._metadata->set_method(std::move(method));
        return *this;
    }
    
    environment_builder& environment_builder::set_uri(std::string uri)
    {
        mutable_env()._metadata->set_uri(std::move(uri));
        return *this;
    }
    
    environment_builder& environment_builder::add_header(std::string name, std::string value)
    {
        auto header = mutable_env()._metadata->add_headers();
        header->set_name(std::move(name));
        header->set_value(std::move(value));
        return *this;
    }
    
    environment_builder& environment_builder::set_remote_address(std::string address)
    {
        mutable_env()._metadata->set_remote_address(std::move(address));
        return *this;
    }
    
    environment_builder& environment_builder::set_setting(const std::string& name, std::string value)
    {
        (*mutable_env()._settings->mutable_values())[name] = std::move(value);
        return *this;
    }
    
    environment_builder& environment_builder::load_settings_json(const std::string& json)
    {
        namespace pbu = google::protobuf::util;
        
        Settings loaded;
        auto status = pbu::JsonStringToMessage(json, std::addressof(loaded));
        if (!status.ok())
        {
            std::ostringstream ss;
            ss << "invalid settings: " << status;
            BOOST_LOG_TRIVIAL(info) << "environment_builder::load_settings_json - " << ss.str();
            throw invalid_settings(ss.str());
        }
        
        auto& target = *mutable_env()._settings->mutable_values();
        for (auto& entry : loaded.values())
        {
            target[entry.first] = entry.second;
        }
        return *this;
    }
    
    environment_ptr environment_builder::build()
    {
        mutable_env();
        auto env = std::move(_env);
        BOOST_LOG_TRIVIAL(debug) << "environment_builder::build - " << *env;
        return env;
    }
    
}}
