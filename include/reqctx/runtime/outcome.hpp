#pragma once

#include <reqctx/runtime/config.hpp>
#include <reqctx/runtime/errors.hpp>
#include <reqctx/runtime/exception.hpp>
#include <boost/optional.hpp>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace reqctx { namespace runtime {
    
    /// the primary failure of an execution
    struct failure
    {
        failure_kind kind;
        std::string message;
        std::exception_ptr exception;
    };
    
    using failure_list = std::vector<std::exception_ptr>;
    
    /// The parts of an outcome which do not depend on the result type.
    /// Cleanup failures are carried whether or not the execution succeeded.
    class outcome_base
    {
    public:
        bool succeeded() const { return not _failure; }
        bool failed() const { return bool(_failure); }
        explicit operator bool() const { return succeeded(); }
        
        /// succeeded and no cleanup action failed
        bool clean() const { return succeeded() and _cleanup_failures.empty(); }
        
        /// @pre failed()
        const failure& get_failure() const;
        
        /// failure_kind of the primary failure, or no error
        error_code code() const;
        
        const failure_list& cleanup_failures() const { return _cleanup_failures; }
        
        /// empty if the environment could not be built
        const std::string& request_id() const { return _request_id; }
        
        /// @throws execution_failure, with the primary exception nested
        void rethrow_if_failed() const;
        
    protected:
        outcome_base(std::string request_id,
                     boost::optional<failure> f,
                     failure_list cleanup_failures)
        : _request_id(std::move(request_id))
        , _failure(std::move(f))
        , _cleanup_failures(std::move(cleanup_failures))
        {}
        
    private:
        std::string _request_id;
        boost::optional<failure> _failure;
        failure_list _cleanup_failures;
    };
    
    /// The terminal result of running a handler: either success carrying a
    /// value, or a failure. Either way, the failures of cleanup actions.
    template<class T>
    class outcome : public outcome_base
    {
    public:
        using value_type = T;
        
        static outcome success(std::string request_id, T value, failure_list cleanup_failures = {})
        {
            return outcome(std::move(request_id), std::move(value), std::move(cleanup_failures));
        }
        
        static outcome make_failed(std::string request_id, failure f, failure_list cleanup_failures = {})
        {
            return outcome(std::move(request_id), std::move(f), std::move(cleanup_failures));
        }
        
        /// @throws execution_failure if the execution failed
        T& value() & {
            rethrow_if_failed();
            return *_value;
        }
        
        const T& value() const & {
            rethrow_if_failed();
            return *_value;
        }
        
        T value() && {
            rethrow_if_failed();
            return std::move(*_value);
        }
        
        T get() && {
            return std::move(*this).value();
        }
        
    private:
        outcome(std::string request_id, T value, failure_list cleanup_failures)
        : outcome_base(std::move(request_id), boost::none, std::move(cleanup_failures))
        , _value(std::move(value))
        {}
        
        outcome(std::string request_id, failure f, failure_list cleanup_failures)
        : outcome_base(std::move(request_id), std::move(f), std::move(cleanup_failures))
        {}
        
        boost::optional<T> _value;
    };
    
    template<>
    class outcome<void> : public outcome_base
    {
    public:
        using value_type = void;
        
        static outcome success(std::string request_id, failure_list cleanup_failures = {})
        {
            return outcome(std::move(request_id), boost::none, std::move(cleanup_failures));
        }
        
        static outcome make_failed(std::string request_id, failure f, failure_list cleanup_failures = {})
        {
            return outcome(std::move(request_id), std::move(f), std::move(cleanup_failures));
        }
        
        void get() const {
            rethrow_if_failed();
        }
        
    private:
        outcome(std::string request_id, boost::optional<failure> f, failure_list cleanup_failures)
        : outcome_base(std::move(request_id), std::move(f), std::move(cleanup_failures))
        {}
    };
    
    /// a one-line description of an exception: demangled type and what()
    std::string describe(const std::exception_ptr& ep);
    
    /// the failure_kind implied by an exception escaping a handler
    failure_kind classify(const std::exception_ptr& ep);
    
}}
