/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_TEXT_DECODER_H
#define DOCTEXT_TEXT_DECODER_H

#include "content.h"
#include "core_export.h"
#include <string>

namespace doctext
{

/**
 * @brief Input side of the unicode sandwich: turns extractor output into UTF-8 text.
 *
 * - unicode_string input is returned unchanged, whatever it contains,
 * - empty input gives empty text without running the detector,
 * - otherwise the encoding is detected statistically and the bytes are converted from it.
 *
 * A leading byte order mark is removed from the decoded text. There is no fallback encoding:
 * bytes the detected encoding cannot represent are an error.
 */
class DOCTEXT_CORE_EXPORT text_decoder
{
public:
	/**
	 * @throw errors::base tagged errors::decoding_failed if the encoding cannot be detected
	 *        or the bytes are invalid in the detected encoding.
	 * @throw errors::base tagged errors::unsupported_encoding if the detected encoding is unknown to iconv.
	 */
	unicode_string decode(const raw_content& content) const;

	/**
	 * @brief Decodes bytes from the given encoding, skipping detection.
	 */
	unicode_string decode(const raw_content& content, const std::string& known_encoding) const;
};

} // namespace doctext

#endif // DOCTEXT_TEXT_DECODER_H
