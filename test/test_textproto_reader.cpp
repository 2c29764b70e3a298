/*

test_textproto_reader.cpp
-------------------------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Checks line, folded line and MIME header reading with raw byte capture, and dot-encoded blocks.

*/

#define BOOST_TEST_MODULE textproto_reader_test

#include <sstream>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <mimetree/textproto/reader.hpp>

using mimetree::error_code;
using mimetree::textproto::reader;
using mimetree::textproto::canonical_mime_header_key;


BOOST_AUTO_TEST_CASE(read_line_keeps_terminators_in_raw)
{
    std::istringstream in("one\r\ntwo\nthree");
    reader rd(in);

    auto l1 = rd.read_line();
    BOOST_REQUIRE(l1.has_value());
    BOOST_TEST(l1->line == "one");
    BOOST_TEST(l1->raw == "one\r\n");

    auto l2 = rd.read_line();
    BOOST_REQUIRE(l2.has_value());
    BOOST_TEST(l2->line == "two");
    BOOST_TEST(l2->raw == "two\n");

    auto l3 = rd.read_line();
    BOOST_REQUIRE(l3.has_value());
    BOOST_TEST(l3->line == "three");
    BOOST_TEST(l3->raw == "three");

    auto l4 = rd.read_line();
    BOOST_REQUIRE(!l4.has_value());
    BOOST_TEST(l4.error().is(error_code::end_of_stream));
}


BOOST_AUTO_TEST_CASE(read_continued_line_unfolds)
{
    std::istringstream in("Subject: hello \r\n  world\r\n\tagain\r\nNext: x\r\n");
    reader rd(in);

    auto l1 = rd.read_continued_line();
    BOOST_REQUIRE(l1.has_value());
    BOOST_TEST(l1->line == "Subject: hello world again");
    BOOST_TEST(l1->raw == "Subject: hello \r\n  world\r\n\tagain\r\n");

    auto l2 = rd.read_continued_line();
    BOOST_REQUIRE(l2.has_value());
    BOOST_TEST(l2->line == "Next: x");
    BOOST_TEST(l2->raw == "Next: x\r\n");
}


BOOST_AUTO_TEST_CASE(read_mime_header_fields_and_raw)
{
    const std::string header = "From: a@example.com\r\nto: c@example.com\r\nX-Multi: 1\r\nx-multi: 2\r\nKey : v\r\n: nokey\r\n";
    std::istringstream in(header + "\r\nbody\r\n");
    reader rd(in);

    auto block = rd.read_mime_header();
    BOOST_REQUIRE(block.has_value());
    BOOST_TEST(block->raw == header);
    BOOST_TEST(block->header.size() == 4u);
    BOOST_TEST(block->header.get("From") == "a@example.com");
    BOOST_TEST(block->header.get("to") == "c@example.com");
    BOOST_TEST(block->header.get("Key") == "v");
    auto multi = block->header.values("X-Multi");
    BOOST_REQUIRE(multi.size() == 2u);
    BOOST_TEST(multi[0] == "1");
    BOOST_TEST(multi[1] == "2");

    std::vector<std::string> keys;
    for (const auto& [key, values] : block->header)
        keys.push_back(key);
    BOOST_TEST(keys == (std::vector<std::string>{"From", "To", "X-Multi", "Key"}), boost::test_tools::per_element());

    auto rest = rd.read_remaining();
    BOOST_REQUIRE(rest.has_value());
    BOOST_TEST(*rest == "body\r\n");
}


BOOST_AUTO_TEST_CASE(read_mime_header_folded_value)
{
    std::istringstream in("Subject: first\r\n second\r\nTo: x\r\n\r\n");
    reader rd(in);

    auto block = rd.read_mime_header();
    BOOST_REQUIRE(block.has_value());
    BOOST_TEST(block->header.get("Subject") == "first second");
    BOOST_TEST(block->raw == "Subject: first\r\n second\r\nTo: x\r\n");
    BOOST_TEST(block->closed);
}


BOOST_AUTO_TEST_CASE(read_mime_header_ends_at_end_of_stream)
{
    std::istringstream in("A: 1\r\nB: 2");
    reader rd(in);

    auto block = rd.read_mime_header();
    BOOST_REQUIRE(block.has_value());
    BOOST_TEST(block->header.get("A") == "1");
    BOOST_TEST(block->header.get("B") == "2");
    BOOST_TEST(block->raw == "A: 1\r\nB: 2");
    BOOST_TEST(!block->closed);

    std::istringstream empty("");
    reader empty_rd(empty);
    auto none = empty_rd.read_mime_header();
    BOOST_REQUIRE(none.has_value());
    BOOST_TEST(none->header.empty());
    BOOST_TEST(!none->closed);
}


BOOST_AUTO_TEST_CASE(read_mime_header_malformed_initial_line)
{
    std::istringstream in("\tbad line\r\nA: b\r\n\r\n");
    reader rd(in);

    auto block = rd.read_mime_header();
    BOOST_REQUIRE(!block.has_value());
    BOOST_TEST(block.error().is(error_code::malformed_header));
    BOOST_TEST(block.error().message() == "malformed MIME header initial line");
    BOOST_TEST(block.error().detail() == "\tbad line");
}


BOOST_AUTO_TEST_CASE(read_mime_header_malformed_initial_line_truncated)
{
    const std::string line = "\t" + std::string(60, 'a') + std::string(60, 'b');
    std::istringstream in(line + "\r\n\r\n");
    reader rd(in);

    auto block = rd.read_mime_header();
    BOOST_REQUIRE(!block.has_value());
    BOOST_TEST(block.error().is(error_code::malformed_header));
    BOOST_TEST(block.error().detail() == "\t" + std::string(49, 'a') + "..." + std::string(50, 'b'));
    BOOST_TEST(block.error().detail().length() == 103u);
}


BOOST_AUTO_TEST_CASE(read_mime_header_line_without_colon)
{
    std::istringstream in("A: 1\r\nnocolon\r\n\r\n");
    reader rd(in);

    auto block = rd.read_mime_header();
    BOOST_REQUIRE(!block.has_value());
    BOOST_TEST(block.error().is(error_code::malformed_header));
    BOOST_TEST(block.error().message() == "malformed MIME header line");
    BOOST_TEST(block.error().detail() == "nocolon");
}


BOOST_AUTO_TEST_CASE(error_preview_limits)
{
    BOOST_TEST(reader::error_preview(std::string(100, 'x')) == std::string(100, 'x'));
    const std::string preview = reader::error_preview(std::string(50, 'a') + "middle" + std::string(50, 'z'));
    BOOST_TEST(preview == std::string(50, 'a') + "..." + std::string(50, 'z'));
}


BOOST_AUTO_TEST_CASE(canonical_keys)
{
    BOOST_TEST(canonical_mime_header_key("content-TYPE") == "Content-Type");
    BOOST_TEST(canonical_mime_header_key("Content-Type") == "Content-Type");
    BOOST_TEST(canonical_mime_header_key("x-mailer") == "X-Mailer");
    BOOST_TEST(canonical_mime_header_key("bad key") == "bad key");
}


BOOST_AUTO_TEST_CASE(dot_bytes_unescape)
{
    std::istringstream in("Hello\r\n..dot\r\na\rb\r\n.\r\nafter\r\n");
    reader rd(in);

    auto block = rd.read_dot_bytes();
    BOOST_REQUIRE(block.has_value());
    BOOST_TEST(*block == "Hello\n.dot\na\rb\n");

    auto next = rd.read_line();
    BOOST_REQUIRE(next.has_value());
    BOOST_TEST(next->line == "after");
}


BOOST_AUTO_TEST_CASE(dot_bytes_unexpected_eof)
{
    std::istringstream in("abc\r\n");
    reader rd(in);

    auto block = rd.read_dot_bytes();
    BOOST_REQUIRE(!block.has_value());
    BOOST_TEST(block.error().is(error_code::unexpected_eof));
}


BOOST_AUTO_TEST_CASE(dot_reader_drained_by_next_read)
{
    std::istringstream in("line1\r\nline2\r\n.\r\nnext\r\n");
    reader rd(in);

    auto& dot = rd.dot_block();
    char buffer[3];
    auto got = dot.read(buffer, sizeof(buffer));
    BOOST_REQUIRE(got.has_value());
    BOOST_TEST(*got == 3u);
    BOOST_TEST(std::string(buffer, 3) == "lin");

    auto next = rd.read_line();
    BOOST_REQUIRE(next.has_value());
    BOOST_TEST(next->line == "next");
}


BOOST_AUTO_TEST_CASE(dot_reader_reports_end)
{
    std::istringstream in(".\r\n");
    mimetree::textproto::dot_reader dot(in);

    char buffer[8];
    auto got = dot.read(buffer, sizeof(buffer));
    BOOST_REQUIRE(!got.has_value());
    BOOST_TEST(got.error().is(error_code::end_of_stream));
    BOOST_TEST(dot.finished());
    BOOST_CHECK(dot.state() == mimetree::textproto::dot_reader::state_t::END);
}


BOOST_AUTO_TEST_CASE(dot_lines)
{
    std::istringstream in("a\r\n..b\r\n.\r\n");
    reader rd(in);

    auto lines = rd.read_dot_lines();
    BOOST_REQUIRE(lines.has_value());
    BOOST_TEST(*lines == (std::vector<std::string>{"a", ".b"}), boost::test_tools::per_element());

    std::istringstream truncated("a\r\n");
    reader rd2(truncated);
    auto missing = rd2.read_dot_lines();
    BOOST_REQUIRE(!missing.has_value());
    BOOST_TEST(missing.error().is(error_code::unexpected_eof));
}
