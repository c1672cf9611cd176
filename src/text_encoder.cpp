/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "text_encoder.h"

#include "charset_converter.h"
#include "log_scope.h"

namespace doctext
{

byte_sequence text_encoder::encode(const unicode_string& text, const std::string& target_encoding) const
{
	log_scope(text.v.size(), target_encoding);
	// the converter is created even for empty text so that unknown names are always reported
	charset_converter converter{std::string{internal_encoding}, target_encoding, charset_converter::invalid_sequence_policy::skip};
	return byte_sequence{converter.convert(text.v)};
}

} // namespace doctext
