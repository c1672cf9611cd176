/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_CHARSET_CONVERTER_H
#define DOCTEXT_CHARSET_CONVERTER_H

#include "core_export.h"
#include "pimpl.h"
#include <string>
#include <string_view>

namespace doctext
{

/**
 * @brief Converts text between two encodings known to iconv.
 *
 * One converter owns one iconv descriptor and can be reused for many conversions,
 * but not concurrently.
 *
 * @code
 * charset_converter to_utf8{"windows-1250", "UTF-8"};
 * std::string utf8 = to_utf8.convert(bytes);
 * @endcode
 */
class DOCTEXT_CORE_EXPORT charset_converter : public with_pimpl<charset_converter>
{
public:
	/// @brief What to do with input that is invalid or not representable in the target encoding.
	enum class invalid_sequence_policy
	{
		fail, ///< throw an error tagged errors::decoding_failed
		skip  ///< drop the offending character and continue
	};

	/**
	 * @throw errors::base tagged errors::unsupported_encoding if either encoding is unknown to iconv.
	 */
	charset_converter(const std::string& from, const std::string& to, invalid_sequence_policy policy = invalid_sequence_policy::fail);
	~charset_converter();
	charset_converter(charset_converter&&) noexcept;
	charset_converter& operator=(charset_converter&&) noexcept;

	std::string convert(std::string_view input) const;

	/**
	 * @brief Checks if text can be converted from and to the given encoding.
	 */
	static bool is_supported(const std::string& encoding);
};

} // namespace doctext

#endif // DOCTEXT_CHARSET_CONVERTER_H
