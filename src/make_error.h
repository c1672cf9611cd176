/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_MAKE_ERROR_H
#define DOCTEXT_MAKE_ERROR_H

#include "diagnostic_context.h"
#include "error.h" // IWYU pragma: keep
#include <tuple> // IWYU pragma: keep
#include <type_traits> // IWYU pragma: keep

#define DOCTEXT_MAKE_ERROR_AT_LOCATION(explicit_location, ...) \
	[&](const auto& doctext_error_location) { \
		auto context_tuple = std::make_tuple(DOCTEXT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__)); \
		return std::apply([&](auto&&... args) { \
			return doctext::errors::impl<std::remove_cvref_t<decltype(args)>...>(context_tuple, doctext_error_location); \
		}, context_tuple); \
	}(explicit_location)

/**
 * @brief Creates an error object holding the given context items and the current source location.
 *
 * @code
 * throw make_error("iconv_open() failed", from, to, errors::unsupported_encoding{});
 * @endcode
 */
#define DOCTEXT_MAKE_ERROR(...) \
	DOCTEXT_MAKE_ERROR_AT_LOCATION(doctext::source_location::current() __VA_OPT__(,) __VA_ARGS__)

#define DOCTEXT_MAKE_ERROR_PTR(...) \
	std::make_exception_ptr(DOCTEXT_MAKE_ERROR(__VA_ARGS__))

#ifdef DOCTEXT_ENABLE_SHORT_MACRO_NAMES
#define make_error DOCTEXT_MAKE_ERROR
#define make_error_ptr DOCTEXT_MAKE_ERROR_PTR
#endif

#endif // DOCTEXT_MAKE_ERROR_H
