/*

export.hpp
----------

Symbol visibility for mimetree. The library is header-only, so the macro only matters when the headers are compiled into a shared
object that re-exports the classes.

*/

#pragma once

#if defined(MIMETREE_STATIC_DEFINE)
#  ifndef MIMETREE_EXPORT
#    define MIMETREE_EXPORT
#  endif
#elif !defined(MIMETREE_EXPORT)
#  if defined(_WIN32) || defined(__CYGWIN__)
#    ifdef MIMETREE_EXPORTS
#      define MIMETREE_EXPORT __declspec(dllexport)
#    else
#      define MIMETREE_EXPORT __declspec(dllimport)
#    endif
#  elif defined(__GNUC__) && __GNUC__ >= 4
#    define MIMETREE_EXPORT __attribute__((visibility("default")))
#  else
#    define MIMETREE_EXPORT
#  endif
#endif
