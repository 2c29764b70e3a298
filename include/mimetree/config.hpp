/*

config.hpp
----------

Global build configuration for mimetree.

Define MIMETREE_NO_EXCEPTIONS to disable the exception-based `unwrap()` helpers of throwing.hpp. The library itself reports every
parsing failure through `mimetree::result`, so the switch only affects the convenience layer.

*/

#pragma once

#if defined(MIMETREE_NO_EXCEPTIONS)
#define MIMETREE_THROWING_ENABLED 0
#else
#define MIMETREE_THROWING_ENABLED 1
#endif

/**
Number of nested `message/rfc822` levels the decomposer unwraps by default.
**/
#ifndef MIMETREE_DEFAULT_RFC822_DEPTH
#define MIMETREE_DEFAULT_RFC822_DEPTH 5
#endif

/**
Multipart nesting budget of the decomposer.
**/
#ifndef MIMETREE_DEFAULT_MULTIPART_DEPTH
#define MIMETREE_DEFAULT_MULTIPART_DEPTH 256
#endif
