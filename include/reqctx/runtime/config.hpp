#pragma once
#include <valuelib/debug/trace.hpp>
#include <boost/asio.hpp>
#include <boost/system/system_error.hpp>

namespace reqctx { namespace runtime {
  
    namespace asio = boost::asio;
    using error_code = boost::system::error_code;
    using error_condition = boost::system::error_condition;
    using error_category = boost::system::error_category;
    using system_error = boost::system::system_error;
    
}}

#define REQCTX_RUNTIME_TRACE 0

#if REQCTX_RUNTIME_TRACE
#define REQCTX_RUNTIME_TRACE_METHOD_N(CLASS,METHOD,...) value::debug::tracer _reqctx_runtime_local_tracer(std::clog, value::debug::classname(CLASS), value::debug::method(METHOD), __VA_ARGS__)

#define REQCTX_RUNTIME_TRACE_METHOD(CLASS,METHOD) value::debug::tracer _reqctx_runtime_local_tracer(std::clog, value::debug::classname(CLASS), value::debug::method(METHOD))


#else
#define REQCTX_RUNTIME_TRACE_METHOD_N(CLASS,METHOD,...)
#define REQCTX_RUNTIME_TRACE_METHOD(class,method)

#endif
