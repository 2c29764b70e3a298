/*

decomposer.hpp
--------------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Decomposition of raw message bytes into a message tree.

*/


#pragma once

#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mimetree/codec/transfer_encoding.hpp>
#include <mimetree/config.hpp>
#include <mimetree/detail/ascii.hpp>
#include <mimetree/detail/log.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/mime/header.hpp>
#include <mimetree/mime/media_type.hpp>
#include <mimetree/mime/message.hpp>
#include <mimetree/mime/multipart.hpp>
#include <mimetree/textproto/reader.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Limits of the decomposition.
**/
struct decomposer_options
{
    /**
    Number of nested `message/rfc822` levels unwrapped; deeper ones stay opaque bodies.
    **/
    unsigned int max_rfc822_depth = MIMETREE_DEFAULT_RFC822_DEPTH;

    /**
    Number of nested multipart levels accepted within one message.
    **/
    unsigned int max_multipart_depth = MIMETREE_DEFAULT_MULTIPART_DEPTH;
};


/**
Parser of raw messages into trees of `message`.

Multipart bodies are split into parts, recursively. A `message/rfc822` body is transfer decoded and parsed as a nested message, up to
the configured depth; when that fails the body is kept as it is.
**/
class MIMETREE_EXPORT decomposer
{
public:

    /**
    Media type prefix of nested messages.
    **/
    static constexpr std::string_view RFC822_TYPE{"message/rfc822"};

    /**
    Index suffix of a nested message.
    **/
    static constexpr std::string_view NESTED_IDX{"0"};

    /**
    Separator of the index components.
    **/
    static constexpr char IDX_SEPARATOR = '-';

    explicit decomposer(decomposer_options options = decomposer_options()) : options_(options)
    {
    }

    const decomposer_options& options() const
    {
        return options_;
    }

    /**
    Decomposing a message.

    @param raw Message bytes.
    @param idx Index of the root node.
    @return    Message tree, or the first header or multipart error met.
    **/
    result<std::unique_ptr<message>> decompose(std::string_view raw, std::string idx = "") const;

    /**
    Decomposing a message stored in a file.

    @param path File to load.
    @return     Message tree, `error_code::stream_error` if the file cannot be read, or the decomposition error.
    **/
    result<std::unique_ptr<message>> decompose_file(const std::filesystem::path& path) const;

    /**
    Getting the boundary of a multipart header.

    @param header Header with the `Content-Type` field.
    @return       Boundary, empty if the media type has none, or the media type error.
    **/
    static result<std::string> extract_boundary(const mime_header& header);

private:

    /**
    Node waiting for its body to be split.
    **/
    struct pending_t
    {
        message* node;
        std::string body;
        unsigned int multipart_depth;
    };

    /**
    Decomposing a message whose nodes are all at the given rfc822 depth.

    A nested message must have its header closed by a blank line, otherwise `error_code::unexpected_eof` is returned so the body stays
    opaque and is rebuilt as it was.
    **/
    result<std::unique_ptr<message>> decompose_message(std::string_view raw, std::string idx, unsigned int rfc822_depth) const;

    /**
    Splitting the bodies of the root and of all its descendants.

    @param root Root node.
    @param body Body of the root.
    @return     Multipart error, if any.
    **/
    result_void read_parts(message& root, std::string body) const;

    /**
    Setting the body of a leaf, parsing it as a nested message when possible.

    @param node Leaf node.
    @param body Raw body.
    **/
    void read_leaf(message& node, std::string body) const;

    decomposer_options options_;
};


inline result<std::unique_ptr<message>> decomposer::decompose(std::string_view raw, std::string idx) const
{
    return decompose_message(raw, std::move(idx), 0);
}


inline result<std::unique_ptr<message>> decomposer::decompose_file(const std::filesystem::path& path) const
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return fail<std::unique_ptr<message>>(error_code::stream_error, "Opening message file failed.", path.string());

    std::ostringstream raw;
    raw << ifs.rdbuf();
    if (ifs.bad())
        return fail<std::unique_ptr<message>>(error_code::stream_error, "Reading message file failed.", path.string());
    return decompose(raw.str());
}


inline result<std::string> decomposer::extract_boundary(const mime_header& header)
{
    auto content_type = header.get("Content-Type");
    auto mt = parse_media_type(content_type);
    if (!mt)
        return fail<std::string>(mt.error());
    return mt->param("boundary");
}


inline result<std::unique_ptr<message>> decomposer::decompose_message(std::string_view raw, std::string idx, unsigned int rfc822_depth) const
{
    std::istringstream in{std::string(raw)};
    textproto::reader rd(in);
    auto block = rd.read_mime_header();
    if (!block)
        return fail<std::unique_ptr<message>>(block.error());
    if (rfc822_depth > 0 && !block->closed)
        return fail<std::unique_ptr<message>>(error_code::unexpected_eof, "Nested message without header end.");
    auto body = rd.read_remaining();
    if (!body)
        return fail<std::unique_ptr<message>>(body.error());

    auto msg = std::make_unique<message>();
    msg->idx(std::move(idx));
    msg->header() = std::move(block->header);
    msg->rfc822_depth(rfc822_depth);
    msg->set_original_header_order(block->raw);

    auto parts = read_parts(*msg, std::move(*body));
    if (!parts)
        return fail<std::unique_ptr<message>>(parts.error());
    return msg;
}


inline result_void decomposer::read_parts(message& root, std::string body) const
{
    std::vector<pending_t> work;
    work.push_back(pending_t{&root, std::move(body), 0});

    while (!work.empty())
    {
        pending_t current = std::move(work.back());
        work.pop_back();
        message& node = *current.node;

        // A malformed content type is not an error, the node is just not multipart.
        auto boundary = extract_boundary(node.header());
        if (!boundary || boundary->empty())
        {
            read_leaf(node, std::move(current.body));
            continue;
        }

        if (current.multipart_depth >= options_.max_multipart_depth)
            return fail<void>(error_code::nesting_too_deep, "Multipart nesting too deep.", node.idx());

        node.boundary(*boundary);
        multipart_reader scanner(std::move(current.body), *boundary);
        std::vector<pending_t> children;
        for (unsigned int n = 1;; n++)
        {
            auto part = scanner.next_part();
            if (!part)
            {
                if (part.error().is(error_code::end_of_stream))
                    break;
                return fail<void>(part.error());
            }

            auto child = std::make_unique<message>();
            child->header() = std::move(part->header);
            child->set_original_header_order(part->raw_header);
            child->rfc822_depth(node.rfc822_depth());
            child->idx(node.idx().empty() ? std::to_string(n) : node.idx() + IDX_SEPARATOR + std::to_string(n));
            if (log::logger::instance().is_enabled(log::level::trace))
                MIMETREE_TRACE(std::format("Part {} found, {} bytes of body.", child->idx(), part->body.length()));

            message& attached = node.add_part(std::move(child));
            children.push_back(pending_t{&attached, std::move(part->body), current.multipart_depth + 1});
        }

        // Parts are processed in document order.
        for (auto it = children.rbegin(); it != children.rend(); ++it)
            work.push_back(std::move(*it));
    }
    return ok();
}


void inline decomposer::read_leaf(message& node, std::string body) const
{
    const std::string content_type = node.header().get("Content-Type");
    if (detail::trim_space_tab(content_type).starts_with(RFC822_TYPE) && node.rfc822_depth() < options_.max_rfc822_depth)
    {
        auto decoded = decode_by_content_encoding(body, node.header().get("Content-Transfer-Encoding"));
        if (decoded)
        {
            std::string nested_idx = node.idx() + IDX_SEPARATOR + std::string(NESTED_IDX);
            auto nested = decompose_message(decoded->body, std::move(nested_idx), node.rfc822_depth() + 1);
            if (nested)
            {
                if (log::logger::instance().is_enabled(log::level::trace))
                    MIMETREE_TRACE(std::format("Nested message unwrapped at {}, depth {}.", node.idx(), node.rfc822_depth() + 1));
                node.body_message(std::move(*nested));
                node.is_decoded(decoded->transformed);
                return;
            }
            MIMETREE_DEBUG(std::format("Nested message at {} kept as body: {}", node.idx(), nested.error().to_string()));
        }
        else
            MIMETREE_DEBUG(std::format("Nested message at {} kept as body: {}", node.idx(), decoded.error().to_string()));
    }
    node.body(std::move(body));
}


} // namespace mimetree
