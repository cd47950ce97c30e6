#pragma once

#include <reqctx/runtime/exception.pb.h>

#include <exception>
#include <vector>

namespace reqctx { namespace runtime { namespace api {
    
    Exception& populate (Exception& emsg, const std::exception& e);
    Exception& populate (Exception& emsg, const std::exception_ptr& ep);

    Exception* populate (Exception* emsg, const std::exception& e);
    Exception* populate (Exception* emsg, const std::exception_ptr& ep);
    Exception* populate (Exception* emsg, const char* text);
    
    ExceptionList& populate (ExceptionList& emsg, const std::vector<std::exception_ptr>& es);
    ExceptionList* populate (ExceptionList* emsg, const std::vector<std::exception_ptr>& es);
    
}}}
