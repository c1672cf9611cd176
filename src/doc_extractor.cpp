/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "doc_extractor.h"

#include "log_scope.h"
#include "serialization_std.h" // IWYU pragma: keep
#include "shell_runner.h"

namespace doctext
{

raw_content doc_extractor::extract(const std::filesystem::path& file_path, const extraction_options&) const
{
	log_scope(file_path);
	process_result result = shell_runner{}.run(command{std::vector<std::string>{"antiword", file_path.string()}});
	return byte_sequence{std::move(result.std_out)};
}

} // namespace doctext
