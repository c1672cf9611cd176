/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_CONTENT_H
#define DOCTEXT_CONTENT_H

#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace doctext
{

/**
 * @brief Bytes in some character encoding, known or not.
 */
struct byte_sequence
{
	std::string v;

	bool operator==(const byte_sequence&) const = default;
};

/**
 * @brief Decoded text. Always valid UTF-8.
 */
struct unicode_string
{
	std::string v;

	bool operator==(const unicode_string&) const = default;
};

/**
 * @brief Output of an extractor: raw bytes or text the extractor has already decoded.
 */
using raw_content = std::variant<byte_sequence, unicode_string>;

/**
 * @brief Extractor-specific options (e.g. `method`, `language`), passed through the pipeline unmodified.
 */
using extraction_options = std::map<std::string, std::string>;

/// @brief Output encoding used when the caller does not name one.
inline constexpr std::string_view default_encoding = "UTF-8";

/// @brief Encoding of unicode_string.
inline constexpr std::string_view internal_encoding = "UTF-8";

} // namespace doctext

#endif // DOCTEXT_CONTENT_H
