/*

message.hpp
-----------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Tree of a decomposed message: header, body, parts and nested message of every node.

*/


#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mimetree/detail/ascii.hpp>
#include <mimetree/mime/header.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Message or MIME part, with the original header bytes kept for an exact rebuild.

A node owns its parts and its nested message; the parent pointer is for navigation only. Messages are movable but not copyable.
**/
class MIMETREE_EXPORT message
{
public:

    using parts_t = std::vector<std::unique_ptr<message>>;

    message() = default;

    message(const message&) = delete;

    /**
    Moving the node, children are re-attached to the new location. The new node has no parent.
    **/
    message(message&& other) noexcept;

    ~message() = default;

    message& operator=(const message&) = delete;

    /**
    Moving the node, children are re-attached to the new location.

    The node keeps its own parent. `other` may be owned by this node, for example one of its parts.
    **/
    message& operator=(message&& other) noexcept;

    mime_header& header()
    {
        return header_;
    }

    const mime_header& header() const
    {
        return header_;
    }

    /**
    Field names in the order first seen in the original header, with the original casing.
    **/
    const std::vector<std::string>& header_order() const
    {
        return header_order_;
    }

    /**
    Appending a field name to the header order.

    @param name Field name.
    **/
    void append_header_order(std::string name)
    {
        header_order_.push_back(std::move(name));
    }

    /**
    Storing the original header bytes and capturing the field order from them.

    @param raw Header bytes as read; trailing line terminators are dropped.
    **/
    void set_original_header_order(std::string_view raw);

    /**
    Original header bytes, without the trailing line terminator. Empty when the node was not decomposed.
    **/
    const std::string& raw_original_header() const
    {
        return raw_original_header_;
    }

    /**
    Replacing the original header bytes, field order is left as it is.

    @param raw Header bytes.
    **/
    void raw_original_header(std::string raw)
    {
        raw_original_header_ = std::move(raw);
    }

    /**
    Flag if the header must be regenerated from the fields instead of the original bytes.
    **/
    bool header_changed() const
    {
        return header_changed_;
    }

    void header_changed(bool changed)
    {
        header_changed_ = changed;
    }

    const std::string& body() const
    {
        return body_;
    }

    void body(std::string content)
    {
        body_ = std::move(content);
    }

    const parts_t& parts() const
    {
        return parts_;
    }

    /**
    Appending a part and attaching it to this node.

    @param part Part to take over.
    @return     The appended part.
    **/
    message& add_part(std::unique_ptr<message> part);

    /**
    Nested message of a `message/rfc822` body, null if none.
    **/
    message* body_message()
    {
        return body_message_.get();
    }

    const message* body_message() const
    {
        return body_message_.get();
    }

    /**
    Setting the nested message and attaching it to this node.

    @param nested Message to take over, null to remove the nested message.
    **/
    void body_message(std::unique_ptr<message> nested);

    const std::string& boundary() const
    {
        return boundary_;
    }

    void boundary(std::string value)
    {
        boundary_ = std::move(value);
    }

    /**
    Flag if the nested message was transfer decoded, so the rebuild encodes it again.
    **/
    bool is_decoded() const
    {
        return is_decoded_;
    }

    void is_decoded(bool decoded)
    {
        is_decoded_ = decoded;
    }

    /**
    Path of the node in the tree, such as `2-1`.
    **/
    const std::string& idx() const
    {
        return idx_;
    }

    void idx(std::string path)
    {
        idx_ = std::move(path);
    }

    /**
    Number of `message/rfc822` levels unwrapped above this node.
    **/
    unsigned int rfc822_depth() const
    {
        return rfc822_depth_;
    }

    void rfc822_depth(unsigned int depth)
    {
        rfc822_depth_ = depth;
    }

    /**
    Node owning this one, null for the root.
    **/
    message* parent() const
    {
        return parent_;
    }

    bool is_multipart() const
    {
        return !parts_.empty();
    }

    bool is_rfc822() const
    {
        return body_message_ != nullptr;
    }

    /**
    Taking over the content of another message.

    Fields of `other` with a non-empty first value replace the ones of this header, fields with an empty value are removed, the rest
    of the header is kept. Body, parts, boundary and nested message are taken from `other`. The header is then marked as changed.
    `other` may be owned by this node, as when a nested message is unwrapped into its container.

    @param other Message to take the content from.
    **/
    void merge(message&& other);

private:

    /**
    Pointing the parent of all children to this node.
    **/
    void adopt_children();

    mime_header header_;

    std::vector<std::string> header_order_;

    std::string raw_original_header_;

    bool header_changed_{false};

    std::string body_;

    parts_t parts_;

    std::unique_ptr<message> body_message_;

    std::string boundary_;

    bool is_decoded_{false};

    std::string idx_;

    unsigned int rfc822_depth_{0};

    message* parent_{nullptr};
};


/**
Describing the structure of a message tree, one block of lines per node, nested nodes indented.

@param msg    Root of the tree.
@param prefix Indentation of the root block.
@return       Lines terminated by CRLF.
**/
inline std::string format_structure(const message& msg, std::string prefix = "");


inline message::message(message&& other) noexcept :
    header_(std::move(other.header_)), header_order_(std::move(other.header_order_)),
    raw_original_header_(std::move(other.raw_original_header_)), header_changed_(other.header_changed_), body_(std::move(other.body_)),
    parts_(std::move(other.parts_)), body_message_(std::move(other.body_message_)), boundary_(std::move(other.boundary_)),
    is_decoded_(other.is_decoded_), idx_(std::move(other.idx_)), rfc822_depth_(other.rfc822_depth_)
{
    adopt_children();
}


inline message& message::operator=(message&& other) noexcept
{
    if (this == &other)
        return *this;

    // Replacing the children may destroy `other`, so its content is taken first.
    message taken(std::move(other));
    header_ = std::move(taken.header_);
    header_order_ = std::move(taken.header_order_);
    raw_original_header_ = std::move(taken.raw_original_header_);
    header_changed_ = taken.header_changed_;
    body_ = std::move(taken.body_);
    parts_ = std::move(taken.parts_);
    body_message_ = std::move(taken.body_message_);
    boundary_ = std::move(taken.boundary_);
    is_decoded_ = taken.is_decoded_;
    idx_ = std::move(taken.idx_);
    rfc822_depth_ = taken.rfc822_depth_;
    adopt_children();
    return *this;
}


void inline message::set_original_header_order(std::string_view raw)
{
    raw = detail::trim_right_crlf(raw);
    raw_original_header_ = std::string(raw);
    header_order_.clear();

    std::string_view::size_type start = 0;
    while (start < raw.length())
    {
        auto eol = raw.find('\n', start);
        std::string_view line = raw.substr(start, eol == std::string_view::npos ? std::string_view::npos : eol - start);
        start = eol == std::string_view::npos ? raw.length() : eol + 1;

        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        // the header ends at the first blank line
        if (line.empty())
            break;
        if (detail::is_space_or_tab(line.front()))
            continue;
        // Spaces before the colon are not part of the name.
        std::string_view name = line.substr(0, line.find(':'));
        while (!name.empty() && name.back() == ' ')
            name.remove_suffix(1);
        header_order_.emplace_back(name);
    }
}


inline message& message::add_part(std::unique_ptr<message> part)
{
    part->parent_ = this;
    parts_.push_back(std::move(part));
    return *parts_.back();
}


void inline message::body_message(std::unique_ptr<message> nested)
{
    body_message_ = std::move(nested);
    if (body_message_)
        body_message_->parent_ = this;
}


void inline message::merge(message&& other)
{
    // `other` may be the nested message or a part of this node, replacing them destroys it.
    message taken(std::move(other));
    for (const auto& [key, values] : taken.header_)
    {
        if (!values.empty() && !values.front().empty())
            header_.set(key, values.front());
        else
            header_.remove(key);
    }

    body_message_ = std::move(taken.body_message_);
    body_ = std::move(taken.body_);
    boundary_ = std::move(taken.boundary_);
    parts_ = std::move(taken.parts_);
    adopt_children();
    header_changed_ = true;
}


void inline message::adopt_children()
{
    for (auto& part : parts_)
        part->parent_ = this;
    if (body_message_)
        body_message_->parent_ = this;
}


inline std::string format_structure(const message& msg, std::string prefix)
{
    static constexpr std::string_view INDENT{"     "};
    static constexpr std::string_view END_OF_LINE{"\r\n"};

    std::string out;
    out += prefix + "IDX: " + msg.idx() + std::string(END_OF_LINE);
    out += prefix + "Content-Type: " + msg.header().get("Content-Type") + std::string(END_OF_LINE);
    out += prefix + "Is Multipart: " + (msg.is_multipart() ? "true" : "false") + std::string(END_OF_LINE);
    out += prefix + "Is RFC822: " + (msg.is_rfc822() ? "true" : "false") + std::string(END_OF_LINE);

    const std::string nested_prefix = prefix + std::string(INDENT);
    if (msg.is_rfc822())
        out += format_structure(*msg.body_message(), nested_prefix);

    out += prefix + "Parts: " + std::to_string(msg.parts().size()) + std::string(END_OF_LINE);
    for (const auto& part : msg.parts())
        out += format_structure(*part, nested_prefix);
    return out;
}


} // namespace mimetree
