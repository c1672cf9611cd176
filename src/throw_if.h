/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_THROW_IF_H
#define DOCTEXT_THROW_IF_H

#include <boost/preprocessor/stringize.hpp>
#include "make_error.h"

/**
 * @brief Throws an error when the condition holds. The text of the condition becomes the error message.
 *
 * @code
 * throw_if(descriptor == invalid_descriptor, "iconv_open() failed", from, to);
 * @endcode
 */
#define DOCTEXT_THROW_IF_AT_LOCATION(triggering_condition, explicit_location, ...) \
	do { \
		if (triggering_condition) \
			throw DOCTEXT_MAKE_ERROR_AT_LOCATION(explicit_location, BOOST_PP_STRINGIZE(triggering_condition) __VA_OPT__(,) __VA_ARGS__); \
	} while (false)

#define DOCTEXT_THROW_IF(triggering_condition, ...) \
	DOCTEXT_THROW_IF_AT_LOCATION(triggering_condition, doctext::source_location::current() __VA_OPT__(,) __VA_ARGS__)

#ifdef DOCTEXT_ENABLE_SHORT_MACRO_NAMES
#define throw_if DOCTEXT_THROW_IF
#endif

#endif // DOCTEXT_THROW_IF_H
