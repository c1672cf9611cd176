/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_CHARSET_DETECTOR_H
#define DOCTEXT_CHARSET_DETECTOR_H

#include "core_export.h"
#include <optional>
#include <string>
#include <string_view>

namespace doctext
{

/**
 * @brief Best guess of the encoding of a byte sequence.
 */
struct detection_result
{
	std::string encoding;
	int confidence; ///< 0..100
};

/**
 * @brief Statistical detection of the character encoding of text without encoding metadata.
 *
 * Backed by the ICU charset detector. Names are returned as reported by ICU
 * (e.g. `UTF-8`, `ISO-8859-2`, `windows-1250`, `IBM424_rtl`).
 */
class DOCTEXT_CORE_EXPORT charset_detector
{
public:
	/**
	 * @return The best matching encoding or std::nullopt if no encoding matches.
	 */
	std::optional<detection_result> detect(std::string_view bytes) const;
};

} // namespace doctext

#endif // DOCTEXT_CHARSET_DETECTOR_H
