#pragma once

#include <reqctx/runtime/outcome.hpp>
#include <reqctx/runtime/api/json.hpp>
#include <reqctx/runtime/outcome.pb.h>
#include <string>

namespace reqctx { namespace runtime { namespace api {
    
    Failure::Kind to_message_kind(failure_kind kind);
    
    Failure& populate(Failure& msg, const failure& f);
    Failure* populate(Failure* msg, const failure& f);
    
    /// describe an outcome for a transport collaborator.
    /// Cleanup failures are reported as failures of kind CLEANUP.
    Outcome& populate(Outcome& msg, const outcome_base& result);
    Outcome* populate(Outcome* msg, const outcome_base& result);
    
    /// render the report of an outcome
    /// @throws std::runtime_error if the report cannot be rendered
    std::string as_json(const outcome_base& result,
                        google::protobuf::util::JsonPrintOptions opts = json_options(compact_json));
    
}}}
