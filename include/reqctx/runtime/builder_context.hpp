#pragma once

#include <reqctx/runtime/context.hpp>
#include <reqctx/runtime/output_accumulator.hpp>
#include <type_traits>
#include <utility>

namespace reqctx { namespace runtime {
    
    class builder_context;
    
    namespace detail {
        template<class Result> struct builder_invoke;
    }
    
    /// the value returned by builder_context::run_builder for a builder
    /// returning Result: the result and the builder's finalized output, or
    /// the output alone when Result is void
    template<class Result>
    using built_type = typename detail::builder_invoke<Result>::type;
    
    /// A context which also accumulates output.
    /// A builder_context does not own a context. Every capability is delegated
    /// to the wrapped context, so state written and cleanups registered from
    /// inside a builder are those of the enclosing request.
    class builder_context final : public capabilities
    {
    public:
        explicit builder_context(context& ctx)
        : _context(ctx)
        {}
        
        builder_context(const builder_context&) = delete;
        builder_context& operator=(const builder_context&) = delete;
        
        const environment& get_environment() const override { return _context.get_environment(); }
        state_cell& state() override { return _context.state(); }
        cleanup_registry& cleanup() override { return _context.cleanup(); }
        const cancellation_token& cancellation() const override { return _context.cancellation(); }
        
        void append(output_accumulator::fragment_type fragment) {
            _output.append(std::move(fragment));
        }
        
        bool merge_metadata(metadata_entry entry) {
            return _output.merge_metadata(std::move(entry));
        }
        
        /// adopt the output of another (usually nested) builder
        void merge(const output_accumulator& other) {
            _output.merge(other);
        }
        
        const output_accumulator& output() const { return _output; }
        
        /// Run fn(context&) against the wrapped context and return its result.
        /// May be called any number of times while the builder runs.
        template<class F>
        auto run_as_handler(F&& fn) -> decltype(std::forward<F>(fn)(std::declval<context&>()))
        {
            return std::forward<F>(fn)(_context);
        }
        
        /// Run fn(builder_context&) as a nested builder over the same context.
        /// @returns the nested builder's result and its finalized output. The
        /// nested output is not merged into this builder.
        template<class F>
        auto run_builder(F&& fn) -> built_type<decltype(std::forward<F>(fn)(std::declval<builder_context&>()))>;
        
    private:
        template<class Result> friend struct detail::builder_invoke;
        
        /// finalize the output and move it out, once, when the builder
        /// function returns
        output_accumulator finish()
        {
            _output.finalize();
            return std::move(_output);
        }
        
        context& _context;
        output_accumulator _output;
    };
    
    namespace detail {
        
        template<class Result>
        struct builder_invoke
        {
            using type = std::pair<std::decay_t<Result>, output_accumulator>;
            
            template<class F>
            static type invoke(builder_context& builder, F&& fn)
            {
                auto result = std::forward<F>(fn)(builder);
                return type(std::move(result), builder.finish());
            }
        };
        
        template<>
        struct builder_invoke<void>
        {
            using type = output_accumulator;
            
            template<class F>
            static type invoke(builder_context& builder, F&& fn)
            {
                std::forward<F>(fn)(builder);
                return builder.finish();
            }
        };
    }
    
    template<class F>
    auto builder_context::run_builder(F&& fn) -> built_type<decltype(std::forward<F>(fn)(std::declval<builder_context&>()))>
    {
        using result_type = decltype(std::forward<F>(fn)(std::declval<builder_context&>()));
        builder_context nested(_context);
        return detail::builder_invoke<result_type>::invoke(nested, std::forward<F>(fn));
    }
    
}}
