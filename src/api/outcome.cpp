#include <reqctx/runtime/api/outcome.hpp>
#include <reqctx/runtime/api/exception.hpp>
#include <memory>

namespace reqctx { namespace runtime { namespace api {
    
    Failure::Kind to_message_kind(failure_kind kind)
    {
        switch (kind)
        {
            case failure_kind::handler: return Failure::HANDLER;
            case failure_kind::cleanup: return Failure::CLEANUP;
            case failure_kind::cancellation: return Failure::CANCELLATION;
            case failure_kind::environment: return Failure::ENVIRONMENT;
        }
        return Failure::NONE;
    }
    
    Failure* populate(Failure* msg, const failure& f)
    {
        msg->Clear();
        msg->set_kind(to_message_kind(f.kind));
        msg->set_message(f.message);
        if (f.exception)
            populate(msg->mutable_exception(), f.exception);
        return msg;
    }
    
    Failure& populate(Failure& msg, const failure& f)
    {
        return *populate(std::addressof(msg), f);
    }
    
    Outcome* populate(Outcome* msg, const outcome_base& result)
    {
        msg->Clear();
        msg->set_request_id(result.request_id());
        msg->set_success(result.succeeded());
        if (result.failed())
            populate(msg->mutable_failure(), result.get_failure());
        for (auto& ep : result.cleanup_failures())
        {
            populate(msg->add_cleanup_failures(),
                     failure { failure_kind::cleanup, describe(ep), ep });
        }
        return msg;
    }
    
    Outcome& populate(Outcome& msg, const outcome_base& result)
    {
        return *populate(std::addressof(msg), result);
    }
    
    std::string as_json(const outcome_base& result,
                        google::protobuf::util::JsonPrintOptions opts)
    {
        Outcome msg;
        populate(msg, result);
        return as_json(msg, opts);
    }
    
}}}
