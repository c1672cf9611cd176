/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "txt_extractor.h"

#include "error_tags.h"
#include <fstream>
#include <iterator>
#include "log_scope.h"
#include "serialization_std.h" // IWYU pragma: keep
#include "throw_if.h"

namespace doctext
{

raw_content txt_extractor::extract(const std::filesystem::path& file_path, const extraction_options&) const
{
	log_scope(file_path);
	std::ifstream stream{file_path, std::ios::binary};
	throw_if(!stream.is_open(), file_path, errors::extraction_failed{});
	std::string bytes{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
	throw_if(stream.bad(), file_path, errors::extraction_failed{});
	return byte_sequence{std::move(bytes)};
}

} // namespace doctext
