#pragma once

#include <mimetree/export.hpp>
#include <mimetree/config.hpp>

#include <mimetree/detail/log.hpp>
#include <mimetree/detail/result.hpp>

#include <mimetree/codec/base64.hpp>
#include <mimetree/codec/codec.hpp>
#include <mimetree/codec/quoted_printable.hpp>
#include <mimetree/codec/transfer_encoding.hpp>

#include <mimetree/textproto/dot_reader.hpp>
#include <mimetree/textproto/header_key.hpp>
#include <mimetree/textproto/reader.hpp>

#include <mimetree/mime/builder.hpp>
#include <mimetree/mime/decomposer.hpp>
#include <mimetree/mime/header.hpp>
#include <mimetree/mime/media_type.hpp>
#include <mimetree/mime/message.hpp>
#include <mimetree/mime/multipart.hpp>

// Exception helpers
#if MIMETREE_THROWING_ENABLED
#include <mimetree/throwing.hpp>
#endif
