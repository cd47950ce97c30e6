#include <reqctx/runtime/state_cell.hpp>

namespace reqctx { namespace runtime {
    
    boost::optional<state_cell::value_type> state_cell::read(const key_type& key) const
    {
        auto lock = get_lock();
        auto ifind = _values.find(key);
        if (ifind == _values.end())
            return boost::none;
        return ifind->second;
    }
    
    void state_cell::write(const key_type& key, value_type value)
    {
        auto lock = get_lock();
        _values[key] = std::move(value);
    }
    
    void state_cell::modify(const key_type& key, const modify_function& fn)
    {
        auto lock = get_lock();
        auto ifind = _values.find(key);
        boost::optional<value_type> current;
        if (ifind != _values.end())
            current = ifind->second;
        
        // if fn throws, the stored value is untouched
        auto next = fn(std::move(current));
        _values[key] = std::move(next);
    }
    
    bool state_cell::erase(const key_type& key)
    {
        auto lock = get_lock();
        return _values.erase(key) != 0;
    }
    
    bool state_cell::contains(const key_type& key) const
    {
        auto lock = get_lock();
        return _values.count(key) != 0;
    }
    
    std::size_t state_cell::size() const
    {
        auto lock = get_lock();
        return _values.size();
    }
    
    auto state_cell::keys() const -> std::vector<key_type>
    {
        auto lock = get_lock();
        std::vector<key_type> result;
        result.reserve(_values.size());
        for (auto& entry : _values)
            result.push_back(entry.first);
        return result;
    }
    
}}
