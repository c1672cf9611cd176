/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "pipeline.h"

#include "error_tags.h"
#include "log_scope.h"
#include "make_error.h"
#include "serialization_std.h" // IWYU pragma: keep
#include "text_decoder.h"
#include "text_encoder.h"

namespace doctext
{

pipeline::pipeline()
	: m_registry(extractor_registry::default_registry())
{}

pipeline::pipeline(const extractor_registry& registry)
	: m_registry(registry)
{}

byte_sequence pipeline::process(const std::filesystem::path& file_path, const std::string& target_encoding, const extraction_options& options) const
{
	log_scope(file_path, target_encoding, options);

	std::error_code ec;
	if (!std::filesystem::exists(file_path, ec))
		throw make_error("File not found", file_path, errors::extraction_failed{});

	std::string extension = extraction::option_or(options, "extension", file_path.extension().string());
	std::unique_ptr<extractor> selected_extractor = m_registry.get().create(extension);

	raw_content content;
	{
		log_scope("extract", file_path, extension);
		content = selected_extractor->extract(file_path, options);
	}
	unicode_string text;
	{
		log_scope("decode");
		text = text_decoder{}.decode(content);
	}
	log_scope("encode", target_encoding);
	return text_encoder{}.encode(text, target_encoding);
}

byte_sequence process(const std::filesystem::path& file_path, const std::string& target_encoding, const extraction_options& options)
{
	return pipeline{}.process(file_path, target_encoding, options);
}

} // namespace doctext
