/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_ERROR_TAGS_H
#define DOCTEXT_ERROR_TAGS_H

#include "command.h"
#include "core_export.h"
#include "serialization_base.h"
#include <string>
#include <string_view>

namespace doctext::errors
{

/**
 * @brief A byte sequence could not be decoded, even with the detected encoding.
 *
 * Errors carrying this tag also carry the name of the attempted encoding.
 */
struct DOCTEXT_CORE_EXPORT decoding_failed { static constexpr std::string_view string() { return "decoding_failed"; } };

/// @brief An encoding name (target or detected) is not recognized by the encoding registry.
struct DOCTEXT_CORE_EXPORT unsupported_encoding { static constexpr std::string_view string() { return "unsupported_encoding"; } };

/**
 * @brief Format-specific failure while extracting content from a file.
 *
 * Missing external program, missing or corrupt file, unsupported file extension or an
 * unsupported extraction method.
 */
struct DOCTEXT_CORE_EXPORT extraction_failed { static constexpr std::string_view string() { return "extraction_failed"; } };

/**
 * @brief An external command exited with a non-zero status.
 *
 * Carries everything needed to diagnose the failure without re-running the command.
 */
struct DOCTEXT_CORE_EXPORT shell_failure
{
	doctext::command command;
	int exit_code;
	std::string std_out;
	std::string std_err;
};

} // namespace doctext::errors

namespace doctext::serialization
{

template <>
struct serializer<errors::shell_failure>
{
	value full(const errors::shell_failure& failure) const
	{
		return object{{
			{"command", serialization::full(failure.command)},
			{"exit_code", static_cast<std::int64_t>(failure.exit_code)},
			{"stdout", failure.std_out},
			{"stderr", failure.std_err}
		}};
	}
	value typed_summary(const errors::shell_failure& failure) const { return decorate_with_typeid(full(failure), type_name::pretty<errors::shell_failure>()); }
};

} // namespace doctext::serialization

#endif // DOCTEXT_ERROR_TAGS_H
