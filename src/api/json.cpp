#include <reqctx/runtime/api/json.hpp>
#include <google/protobuf/util/type_resolver_util.h>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace reqctx { namespace runtime { namespace api {

    std::string as_json(const google::protobuf::Message& msg,
                        google::protobuf::util::JsonPrintOptions opts)
    {
        namespace pb = google::protobuf;
        namespace pbu = google::protobuf::util;
        
        auto buffer = msg.SerializeAsString();
        std::string result;
        
        auto resolver = std::unique_ptr<pbu::TypeResolver> {
            pbu::NewTypeResolverForDescriptorPool("",
                                                  pb::DescriptorPool::generated_pool())
        };
        
        auto status = pbu::BinaryToJsonString(resolver.get(),
                                              "/" + msg.GetDescriptor()->full_name(),
                                              buffer,
                                              std::addressof(result),
                                              opts);
        if (!status.ok())
        {
            std::ostringstream ss;
            ss << status;
            throw std::runtime_error(ss.str());
        }
        return result;
    }
    
}}}
