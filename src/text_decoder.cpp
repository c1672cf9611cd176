/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "text_decoder.h"

#include <boost/algorithm/string/predicate.hpp>
#include "charset_converter.h"
#include "charset_detector.h"
#include "error_tags.h"
#include "log_scope.h"
#include "make_error.h"
#include <optional>

namespace doctext
{

namespace
{

constexpr std::string_view utf8_bom = "\xEF\xBB\xBF";

// ICU names the text direction of some charsets (IBM424_rtl, ISO-8859-8-I for logical Hebrew).
// The bytes are the same as in the base charset, which is the only one iconv knows.
std::string to_iconv_name(const std::string& detected_encoding)
{
	std::string encoding = detected_encoding;
	for (std::string_view suffix : {"_ltr", "_rtl"})
	{
		if (boost::algorithm::iends_with(encoding, suffix))
		{
			encoding.resize(encoding.size() - suffix.size());
			break;
		}
	}
	if (boost::algorithm::iequals(encoding, "ISO-8859-8-I"))
		return "ISO-8859-8";
	return encoding;
}

unicode_string convert_to_unicode(const std::string& bytes, const std::string& encoding)
{
	charset_converter converter{encoding, std::string{internal_encoding}};
	std::string text = converter.convert(bytes);
	if (text.starts_with(utf8_bom))
		text.erase(0, utf8_bom.size());
	return unicode_string{std::move(text)};
}

} // anonymous namespace

unicode_string text_decoder::decode(const raw_content& content) const
{
	if (const unicode_string* text = std::get_if<unicode_string>(&content))
		return *text;
	const std::string& bytes = std::get<byte_sequence>(content).v;
	if (bytes.empty())
		return unicode_string{};
	log_scope(bytes.size());

	std::optional<detection_result> detected = charset_detector{}.detect(bytes);
	if (!detected)
		throw make_error("Cannot detect encoding", bytes.size(), errors::decoding_failed{});
	log_entry(detected->encoding, detected->confidence);
	std::string encoding = to_iconv_name(detected->encoding);
	try
	{
		return convert_to_unicode(bytes, encoding);
	}
	catch (const std::exception&)
	{
		std::throw_with_nested(make_error("Cannot decode bytes in detected encoding", encoding));
	}
}

unicode_string text_decoder::decode(const raw_content& content, const std::string& known_encoding) const
{
	if (const unicode_string* text = std::get_if<unicode_string>(&content))
		return *text;
	const std::string& bytes = std::get<byte_sequence>(content).v;
	if (bytes.empty())
		return unicode_string{};
	log_scope(bytes.size(), known_encoding);
	return convert_to_unicode(bytes, known_encoding);
}

} // namespace doctext
