#pragma once

#include <reqctx/runtime/config.hpp>
#include <boost/any.hpp>
#include <boost/optional.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace reqctx { namespace runtime {
    
    /// The mutable, request-local state slot owned by a context.
    /// Writes are never rolled back: a value written before a handler fails
    /// is still observable by every later read until the context is torn down.
    class state_cell
    {
        using mutex_type = std::mutex;
        using lock_type = std::unique_lock<mutex_type>;
        auto get_lock() const { return lock_type(_mutex); }
        
    public:
        using key_type = std::string;
        using value_type = boost::any;
        using modify_function = std::function<value_type(boost::optional<value_type>)>;
        
        state_cell() = default;
        state_cell(const state_cell&) = delete;
        state_cell& operator=(const state_cell&) = delete;
        
        boost::optional<value_type> read(const key_type& key) const;
        
        /// @throws boost::bad_any_cast if the key holds a value of another type
        template<class T>
        boost::optional<T> read_as(const key_type& key) const
        {
            auto v = read(key);
            if (not v)
                return boost::none;
            return boost::any_cast<T>(*v);
        }
        
        void write(const key_type& key, value_type value);
        
        /// Replace the value at `key` with fn(current value) as one indivisible
        /// step.
        /// @note fn must not access this state_cell
        void modify(const key_type& key, const modify_function& fn);
        
        bool erase(const key_type& key);
        bool contains(const key_type& key) const;
        std::size_t size() const;
        std::vector<key_type> keys() const;
        
    private:
        mutable mutex_type _mutex;
        std::map<key_type, value_type> _values;
    };
    
}}
