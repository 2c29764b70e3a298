/*

test_media_type.cpp
-------------------

Copyright (C) 2025, mimetree contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Checks parsing of media types with parameters.

*/

#define BOOST_TEST_MODULE media_type_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <mimetree/mime/media_type.hpp>

using mimetree::error_code;
using mimetree::parse_media_type;


BOOST_AUTO_TEST_CASE(type_without_parameters)
{
    auto mt = parse_media_type("text/plain");
    BOOST_REQUIRE(mt.has_value());
    BOOST_TEST(mt->value == "text/plain");
    BOOST_TEST(mt->params.empty());
}


BOOST_AUTO_TEST_CASE(parameters_lower_cased_and_unquoted)
{
    auto mt = parse_media_type("Multipart/Mixed; Boundary=\"a b\\\"c\"; charset=utf-8");
    BOOST_REQUIRE(mt.has_value());
    BOOST_TEST(mt->value == "multipart/mixed");
    BOOST_TEST(mt->params.size() == 2u);
    BOOST_TEST(mt->param("boundary") == "a b\"c");
    BOOST_TEST(mt->param("charset") == "utf-8");
    BOOST_TEST(mt->param("name") == "");
}


BOOST_AUTO_TEST_CASE(whitespace_and_trailing_semicolon)
{
    auto spaced = parse_media_type("  text/plain ; charset = us-ascii ");
    BOOST_REQUIRE(spaced.has_value());
    BOOST_TEST(spaced->value == "text/plain");
    BOOST_TEST(spaced->param("charset") == "us-ascii");

    auto trailing = parse_media_type("text/plain;");
    BOOST_REQUIRE(trailing.has_value());
    BOOST_TEST(trailing->params.empty());

    auto folded = parse_media_type("multipart/related;\r\n\tboundary=xyz");
    BOOST_REQUIRE(folded.has_value());
    BOOST_TEST(folded->param("boundary") == "xyz");

    auto empty_quoted = parse_media_type("text/plain; name=\"\"");
    BOOST_REQUIRE(empty_quoted.has_value());
    BOOST_TEST(empty_quoted->params.count("name") == 1u);
    BOOST_TEST(empty_quoted->param("name") == "");
}


BOOST_AUTO_TEST_CASE(malformed_values)
{
    for (const char* text : {"", "   ", "text", "text/", "/plain", "text/plain/x", "text/plain; charset", "text/plain; =x",
        "text/plain; a=\"unterminated", "text/plain; a=", "text/plain junk"})
    {
        auto mt = parse_media_type(text);
        BOOST_TEST_CONTEXT("value `" << text << "`")
        {
            BOOST_REQUIRE(!mt.has_value());
            BOOST_TEST(mt.error().is(error_code::media_type_error));
        }
    }
}


BOOST_AUTO_TEST_CASE(duplicate_parameter)
{
    auto mt = parse_media_type("text/plain; a=1; A=2");
    BOOST_REQUIRE(!mt.has_value());
    BOOST_TEST(mt.error().is(error_code::media_type_error));
    BOOST_TEST(mt.error().message() == "Duplicate media parameter.");
}
