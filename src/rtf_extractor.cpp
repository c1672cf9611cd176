/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "rtf_extractor.h"

#include "log_scope.h"
#include "serialization_std.h" // IWYU pragma: keep
#include "shell_runner.h"

namespace doctext
{

namespace
{

// unrtf --text starts with "###" comment lines closed by a line of 17 dashes
constexpr std::string_view banner_end = "-----------------\n";

} // anonymous namespace

raw_content rtf_extractor::extract(const std::filesystem::path& file_path, const extraction_options&) const
{
	log_scope(file_path);
	process_result result = shell_runner{}.run(command{std::vector<std::string>{"unrtf", "--text", file_path.string()}});
	std::string& text = result.std_out;
	if (std::string::size_type pos = text.find(banner_end); pos != std::string::npos)
		text.erase(0, pos + banner_end.size());
	return byte_sequence{std::move(text)};
}

} // namespace doctext
