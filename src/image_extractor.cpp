/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "image_extractor.h"

#include "environment.h"
#include "log_scope.h"
#include "serialization_std.h" // IWYU pragma: keep
#include "shell_runner.h"

namespace doctext
{

namespace extraction
{

std::string recognize_image(const std::filesystem::path& image_path, const extraction_options& options)
{
	std::vector<std::string> argv{"tesseract", image_path.string(), "stdout"};
	std::string language = option_or(options, "language", environment::get_or(environment::tesseract_language_variable, ""));
	if (!language.empty())
	{
		argv.push_back("-l");
		argv.push_back(language);
	}
	log_entry(image_path, language);
	return shell_runner{}.run(command{std::move(argv)}).std_out;
}

} // namespace extraction

raw_content image_extractor::extract(const std::filesystem::path& file_path, const extraction_options& options) const
{
	log_scope(file_path);
	return byte_sequence{extraction::recognize_image(file_path, options)};
}

} // namespace doctext
