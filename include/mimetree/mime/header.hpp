/*

header.hpp
----------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Multi-valued MIME header map keyed by canonical field names.

*/


#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mimetree/textproto/header_key.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Header fields of a message or part.

Keys are canonicalized on every access. Iteration follows the order in which keys were first inserted, and the values of a key keep
their insertion order.
**/
class MIMETREE_EXPORT mime_header
{
public:

    /**
    Values of one field.
    **/
    using values_t = std::vector<std::string>;

    /**
    Field name with its values.
    **/
    using entry_t = std::pair<std::string, values_t>;

    using const_iterator = std::vector<entry_t>::const_iterator;

    /**
    Appending a value to a field.

    @param key   Field name.
    @param value Value to append.
    **/
    void add(std::string_view key, std::string value)
    {
        std::string canonical = textproto::canonical_mime_header_key(key);
        auto it = find(canonical);
        if (it == entries_.end())
            entries_.emplace_back(std::move(canonical), values_t{std::move(value)});
        else
            it->second.push_back(std::move(value));
    }

    /**
    Replacing all values of a field with the given one. A new field goes to the end of the order.

    @param key   Field name.
    @param value Value to set.
    **/
    void set(std::string_view key, std::string value)
    {
        std::string canonical = textproto::canonical_mime_header_key(key);
        auto it = find(canonical);
        if (it == entries_.end())
            entries_.emplace_back(std::move(canonical), values_t{std::move(value)});
        else
            it->second.assign(1, std::move(value));
    }

    /**
    Getting the first value of a field.

    @param key Field name.
    @return    First value, empty string if the field is absent.
    **/
    std::string get(std::string_view key) const
    {
        auto it = find(textproto::canonical_mime_header_key(key));
        if (it == entries_.end() || it->second.empty())
            return {};
        return it->second.front();
    }

    /**
    Getting all values of a field.

    @param key Field name.
    @return    Values in insertion order, empty if the field is absent.
    **/
    values_t values(std::string_view key) const
    {
        auto it = find(textproto::canonical_mime_header_key(key));
        if (it == entries_.end())
            return {};
        return it->second;
    }

    /**
    Checking for a field.

    @param key Field name.
    @return    True if present.
    **/
    bool contains(std::string_view key) const
    {
        return find(textproto::canonical_mime_header_key(key)) != entries_.end();
    }

    /**
    Removing a field with all its values.

    @param key Field name.
    **/
    void remove(std::string_view key)
    {
        auto it = find(textproto::canonical_mime_header_key(key));
        if (it != entries_.end())
            entries_.erase(it);
    }

    std::size_t size() const
    {
        return entries_.size();
    }

    bool empty() const
    {
        return entries_.empty();
    }

    const_iterator begin() const
    {
        return entries_.begin();
    }

    const_iterator end() const
    {
        return entries_.end();
    }

private:

    std::vector<entry_t>::iterator find(std::string_view canonical)
    {
        return std::find_if(entries_.begin(), entries_.end(), [canonical](const entry_t& e) { return e.first == canonical; });
    }

    std::vector<entry_t>::const_iterator find(std::string_view canonical) const
    {
        return std::find_if(entries_.begin(), entries_.end(), [canonical](const entry_t& e) { return e.first == canonical; });
    }

    /**
    Fields in first insertion order.
    **/
    std::vector<entry_t> entries_;
};


} // namespace mimetree
