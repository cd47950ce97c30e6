#include <reqctx/runtime/output_accumulator.hpp>
#include <numeric>
#include <ostream>

namespace reqctx { namespace runtime {
    
    std::ostream& operator<<(std::ostream& os, const metadata_entry& entry)
    {
        return os << entry.kind << ":" << entry.identity;
    }
    
    void output_accumulator::check_open(const char* operation) const
    {
        if (_finalized)
            throw accumulator_finalized(std::string("output_accumulator::") + operation + " : output is finalized");
    }
    
    void output_accumulator::append(fragment_type fragment)
    {
        check_open(__func__);
        _fragments.push_back(std::move(fragment));
    }
    
    bool output_accumulator::merge_metadata(metadata_entry entry)
    {
        check_open(__func__);
        return _metadata.insert(std::move(entry)).second;
    }
    
    void output_accumulator::merge(const output_accumulator& other)
    {
        check_open(__func__);
        _fragments.insert(_fragments.end(),
                          other._fragments.begin(),
                          other._fragments.end());
        _metadata.insert(other._metadata.begin(), other._metadata.end());
    }
    
    std::string output_accumulator::str() const
    {
        auto size = std::accumulate(_fragments.begin(), _fragments.end(), std::size_t(0),
                                    [](std::size_t total, const fragment_type& f) { return total + f.size(); });
        std::string result;
        result.reserve(size);
        for (auto& f : _fragments)
            result += f;
        return result;
    }
    
}}
