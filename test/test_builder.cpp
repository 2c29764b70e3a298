/*

test_builder.cpp
----------------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Checks writing of message trees and in place rewriting of original header fields.

*/

#define BOOST_TEST_MODULE builder_test

#include <memory>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mimetree/codec/transfer_encoding.hpp>
#include <mimetree/mime/builder.hpp>
#include <mimetree/mime/decomposer.hpp>

using mimetree::builder;
using mimetree::decomposer;
using mimetree::message;


namespace
{

std::unique_ptr<message> text_part(const std::string& text)
{
    auto part = std::make_unique<message>();
    part->header().set("Content-Type", "text/plain");
    part->body(text);
    return part;
}

std::vector<std::string> split_lines(const std::string& text)
{
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    while (start <= text.length())
    {
        auto end = text.find("\r\n", start);
        if (end == std::string::npos)
        {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 2;
    }
    return lines;
}

std::unique_ptr<message> decompose(const std::string& raw)
{
    decomposer dec;
    auto msg = dec.decompose(raw);
    BOOST_REQUIRE(msg.has_value());
    return std::move(*msg);
}

}


BOOST_AUTO_TEST_CASE(multipart_delimiters)
{
    message root;
    root.header().set("Content-Type", "multipart/mixed; boundary=abc");
    root.boundary("abc");
    root.add_part(text_part("part 1"));
    root.add_part(text_part("part 2"));
    root.add_part(text_part("part 3"));

    builder bld;
    const std::string out = bld.build(root);
    BOOST_TEST(out ==
        "Content-Type: multipart/mixed; boundary=abc\r\n\r\n"
        "\r\n--abc\r\nContent-Type: text/plain\r\n\r\npart 1"
        "\r\n"
        "\r\n--abc\r\nContent-Type: text/plain\r\n\r\npart 2"
        "\r\n"
        "\r\n--abc\r\nContent-Type: text/plain\r\n\r\npart 3"
        "\r\n--abc--\r\n");

    unsigned int delimiters = 0;
    unsigned int close_delimiters = 0;
    for (const auto& line : split_lines(out))
    {
        if (line == "--abc")
            delimiters++;
        else if (line == "--abc--")
            close_delimiters++;
    }
    BOOST_TEST(delimiters == 3u);
    BOOST_TEST(close_delimiters == 1u);

    auto parsed = decompose(out);
    BOOST_REQUIRE(parsed->parts().size() == 3u);
    BOOST_TEST(parsed->parts()[2]->body() == "part 3");
}


BOOST_AUTO_TEST_CASE(boundary_generated_when_missing)
{
    message root;
    root.header().set("Content-Type", "multipart/mixed");
    root.add_part(text_part("only"));

    builder bld;
    const std::string out = bld.build(root);
    BOOST_TEST(root.boundary().length() == 60u);
    BOOST_TEST(out.find("\r\n--" + root.boundary() + "\r\n") != std::string::npos);
    BOOST_TEST(out.find("\r\n--" + root.boundary() + "--\r\n") != std::string::npos);

    const std::string boundary = root.boundary();
    bld.build(root);
    BOOST_TEST(root.boundary() == boundary);
}


BOOST_AUTO_TEST_CASE(multipart_rebuild_terminates_inner_parts)
{
    const std::string raw =
        "Content-Type: multipart/mixed; boundary=\"b1\"\r\n"
        "\r\n"
        "--b1\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "one\r\n"
        "--b1\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "two\r\n"
        "--b1--\r\n";
    auto msg = decompose(raw);

    builder bld;
    const std::string once = bld.build(*msg);
    BOOST_TEST(once.starts_with("Content-Type: multipart/mixed; boundary=\"b1\"\r\n\r\n\r\n--b1\r\nContent-Type: text/plain\r\n\r\none"));

    BOOST_REQUIRE(msg->parts().size() == 2u);
    BOOST_TEST(msg->parts()[0]->body() == "one");
    BOOST_TEST(msg->parts()[1]->body() == "two");

    // The terminator written before each following delimiter stays in the body of the part above it.
    auto again = decompose(once);
    BOOST_REQUIRE(again->parts().size() == 2u);
    BOOST_TEST(again->parts()[0]->header().get("Content-Type") == "text/plain");
    BOOST_TEST(again->parts()[0]->body() == "one\r\n");
    BOOST_TEST(again->parts()[1]->body() == "two");

    auto third = decompose(bld.build(*again));
    BOOST_REQUIRE(third->parts().size() == 2u);
    BOOST_TEST(third->parts()[0]->body() == "one\r\n\r\n");
    BOOST_TEST(third->parts()[1]->body() == "two");
}


BOOST_AUTO_TEST_CASE(set_header_field_first_line)
{
    auto msg = decompose("A: 1\r\nB: 2\r\n\r\nbody");
    BOOST_TEST(msg->raw_original_header() == "A: 1\r\nB: 2");

    builder bld;
    bld.set_header_field(*msg, "A", "9");
    BOOST_TEST(msg->raw_original_header() == "A: 9\r\nB: 2");
    BOOST_TEST(msg->header().get("A") == "9");
    BOOST_TEST(msg->header().get("B") == "2");
    BOOST_TEST(!msg->header_changed());
    BOOST_TEST(bld.build_header(*msg) == "A: 9\r\nB: 2");
    BOOST_TEST(bld.build(*msg) == "A: 9\r\nB: 2\r\n\r\nbody");
}


BOOST_AUTO_TEST_CASE(set_header_field_last_line)
{
    auto msg = decompose("A: 1\r\nB: 2\r\n\r\n");
    builder bld;
    bld.set_header_field(*msg, "B", "9");
    BOOST_TEST(msg->raw_original_header() == "A: 1\r\nB: 9");

    // original header kept with its final terminator
    message unterminated;
    unterminated.header().set("A", "1");
    unterminated.header().set("B", "2");
    unterminated.raw_original_header("A: 1\r\nB: 2\r\n");
    bld.set_header_field(unterminated, "B", "9");
    BOOST_TEST(unterminated.raw_original_header() == "A: 1\r\nB: 9");
}


BOOST_AUTO_TEST_CASE(set_header_field_case_insensitive)
{
    auto msg = decompose("Subject: old\r\nTo: x\r\n\r\n");
    builder bld;
    bld.set_header_field(*msg, "subject", "new");
    BOOST_TEST(msg->raw_original_header() == "subject: new\r\nTo: x");
    BOOST_TEST(msg->header().get("Subject") == "new");
    BOOST_TEST(msg->header().values("Subject").size() == 1u);
}


BOOST_AUTO_TEST_CASE(set_header_field_folded)
{
    auto msg = decompose("Subject: one\r\n two\r\n\tthree\r\nB: 2\r\n\r\n");
    builder bld;
    bld.set_header_field(*msg, "Subject", "new");
    BOOST_TEST(msg->raw_original_header() == "Subject: new\r\nB: 2");

    auto last = decompose("A: 1\r\nSubject: one\r\n\ttwo\r\n\r\n");
    bld.set_header_field(*last, "Subject", "new");
    BOOST_TEST(last->raw_original_header() == "A: 1\r\nSubject: new");
}


BOOST_AUTO_TEST_CASE(set_header_field_absent)
{
    auto msg = decompose("A: 1\r\nB: 2\r\n\r\n");
    builder bld;
    bld.set_header_field(*msg, "C", "3");
    BOOST_TEST(msg->raw_original_header() == "A: 1\r\nB: 2\r\nC: 3");
    BOOST_TEST(msg->header_order() == (std::vector<std::string>{"A", "B", "C"}), boost::test_tools::per_element());
    BOOST_TEST(msg->header().get("C") == "3");
}


BOOST_AUTO_TEST_CASE(set_header_field_matches_whole_names)
{
    auto msg = decompose("X-A: 1\r\nB: A\r\nA: 2\r\n\r\n");
    builder bld;
    bld.set_header_field(*msg, "A", "9");
    BOOST_TEST(msg->raw_original_header() == "X-A: 1\r\nB: A\r\nA: 9");
    BOOST_TEST(msg->header().get("X-A") == "1");
}


BOOST_AUTO_TEST_CASE(set_header_field_without_original)
{
    message msg;
    msg.header().set("A", "1");
    builder bld;
    bld.set_header_field(msg, "A", "2");
    BOOST_TEST(msg.raw_original_header() == "");
    BOOST_TEST(msg.header_order().empty());
    BOOST_TEST(bld.build_header(msg) == "A: 2");
}


BOOST_AUTO_TEST_CASE(header_regenerated_in_original_order)
{
    auto msg = decompose("Subject: s\r\nFrom: f\r\nReceived: a\r\nTo: t\r\nreceived: b\r\n\r\nbody");
    msg->header_changed(true);
    msg->header().set("X-New", "n");
    msg->header().set("X-Empty", "");
    msg->header().remove("From");

    builder bld;
    BOOST_TEST(bld.build_header(*msg) == "Subject: s\r\nReceived: a\r\nReceived: b\r\nTo: t\r\nX-New: n");
}


BOOST_AUTO_TEST_CASE(newline_configuration)
{
    message msg;
    msg.header().set("A", "1");
    msg.header().set("B", "2");
    msg.body("x");

    builder bld;
    BOOST_TEST(bld.newline() == "\r\n");
    bld.newline("\n");
    BOOST_TEST(bld.build(msg) == "A: 1\nB: 2\n\nx");
}


BOOST_AUTO_TEST_CASE(decoded_body_encoded_back)
{
    auto inner = std::make_unique<message>();
    inner->header().set("Subject", "x");
    inner->body("hi");

    message msg;
    msg.header().set("Content-Type", "message/rfc822");
    msg.header().set("Content-Transfer-Encoding", "base64");
    msg.body_message(std::move(inner));
    msg.is_decoded(true);

    builder bld;
    const std::string out = bld.build(msg);
    const std::string prefix = "Content-Type: message/rfc822\r\nContent-Transfer-Encoding: base64\r\n\r\n";
    BOOST_REQUIRE(out.starts_with(prefix));
    auto decoded = mimetree::decode_by_content_encoding(out.substr(prefix.length()), "base64");
    BOOST_REQUIRE(decoded.has_value());
    BOOST_TEST(decoded->body == "Subject: x\r\n\r\nhi");
}
