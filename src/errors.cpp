#include <reqctx/runtime/errors.hpp>
#include <ostream>

namespace reqctx { namespace runtime {

    namespace {

        struct _failure_category : error_category
        {
            const char *     name() const noexcept override {
                return "reqctx::runtime::failure";
            }
            
            std::string message( int ev ) const override
            {
                switch (static_cast<failure_kind>(ev))
                {
                    case failure_kind::handler:
                        return "handler failure";
                        
                    case failure_kind::cleanup:
                        return "cleanup failure";
                        
                    case failure_kind::cancellation:
                        return "operation cancelled";
                        
                    case failure_kind::environment:
                        return "environment construction failure";
                        
                    default:
                        return "unknown error: " + std::to_string(ev);
                }
            }
        };
    }
    
    const error_category& failure_category()
    {
        static const _failure_category _ {};
        return _;
    }
    
    error_code make_error_code(failure_kind kind)
    {
        return error_code(static_cast<int>(kind), failure_category());
    }
    
    error_condition make_error_condition(failure_kind kind)
    {
        return error_condition(static_cast<int>(kind), failure_category());
    }
    
    const char* to_string(failure_kind kind)
    {
        switch (kind)
        {
            case failure_kind::handler: return "handler";
            case failure_kind::cleanup: return "cleanup";
            case failure_kind::cancellation: return "cancellation";
            case failure_kind::environment: return "environment";
        }
        return "unknown";
    }
    
    std::ostream& operator<<(std::ostream& os, failure_kind kind)
    {
        return os << to_string(kind);
    }
    
}}
