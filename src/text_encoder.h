/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_TEXT_ENCODER_H
#define DOCTEXT_TEXT_ENCODER_H

#include "content.h"
#include "core_export.h"
#include <string>

namespace doctext
{

/**
 * @brief Output side of the unicode sandwich: turns UTF-8 text into bytes in the requested encoding.
 *
 * Characters the target encoding cannot represent are dropped. This is the only place in the
 * pipeline where text is lost on purpose.
 *
 * @code
 * text_encoder{}.encode(unicode_string{"naïve café"}, "ASCII").v == "nave caf";
 * @endcode
 */
class DOCTEXT_CORE_EXPORT text_encoder
{
public:
	/**
	 * @throw errors::base tagged errors::unsupported_encoding if the target encoding is unknown to iconv.
	 */
	byte_sequence encode(const unicode_string& text, const std::string& target_encoding) const;
};

} // namespace doctext

#endif // DOCTEXT_TEXT_ENCODER_H
