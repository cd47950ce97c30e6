#pragma once

#include <reqctx/runtime/config.hpp>
#include <reqctx/runtime/exception.hpp>
#include <iosfwd>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace reqctx { namespace runtime {
    
    /// A side-channel entry carried alongside the output, e.g. an asset the
    /// output requires. Two entries with the same kind and identity are the
    /// same entry.
    struct metadata_entry
    {
        std::string kind;
        std::string identity;
        
        friend bool operator<(const metadata_entry& l, const metadata_entry& r)
        {
            return std::tie(l.kind, l.identity) < std::tie(r.kind, r.identity);
        }
        
        friend bool operator==(const metadata_entry& l, const metadata_entry& r)
        {
            return std::tie(l.kind, l.identity) == std::tie(r.kind, r.identity);
        }
    };
    
    std::ostream& operator<<(std::ostream& os, const metadata_entry& entry);
    
    /// The output of a builder: an ordered list of opaque fragments and a set
    /// of metadata entries.
    /// An accumulator is append-only until finalized, and read-only after.
    class output_accumulator
    {
    public:
        using fragment_type = std::string;
        using fragment_list = std::vector<fragment_type>;
        using metadata_set = std::set<metadata_entry>;
        
        /// @throws accumulator_finalized
        void append(fragment_type fragment);
        
        /// insert the entry unless an equal entry is already present
        /// @returns true if the entry was new
        /// @throws accumulator_finalized
        bool merge_metadata(metadata_entry entry);
        
        /// append the fragments of `other` and merge its metadata
        /// @throws accumulator_finalized
        void merge(const output_accumulator& other);
        
        void finalize() { _finalized = true; }
        bool finalized() const { return _finalized; }
        
        const fragment_list& fragments() const { return _fragments; }
        const metadata_set& metadata() const { return _metadata; }
        
        /// all fragments concatenated in order
        std::string str() const;
        
        bool empty() const { return _fragments.empty() and _metadata.empty(); }
        
    private:
        void check_open(const char* operation) const;
        
        fragment_list _fragments;
        metadata_set _metadata;
        bool _finalized = false;
    };
    
}}
