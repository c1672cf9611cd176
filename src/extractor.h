/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_EXTRACTOR_H
#define DOCTEXT_EXTRACTOR_H

#include "content.h"
#include "core_export.h"
#include <filesystem>

namespace doctext
{

/**
 * @brief Turns a document file of one format family into raw textual content.
 *
 * Implementations return whatever is most natural for them: bytes in an unknown encoding
 * (most external tools) or text that is already decoded. The pipeline takes care of both.
 *
 * Options are extractor-specific, unknown keys are ignored. Failures of external commands are
 * propagated unchanged, all other failures are tagged errors::extraction_failed.
 */
class DOCTEXT_CORE_EXPORT extractor
{
public:
	virtual ~extractor() = default;

	virtual raw_content extract(const std::filesystem::path& file_path, const extraction_options& options) const = 0;
};

namespace extraction
{

/**
 * @brief Returns the value of the option or the fallback when the option is absent.
 */
inline std::string option_or(const extraction_options& options, const std::string& key, const std::string& fallback)
{
	auto it = options.find(key);
	return it != options.end() ? it->second : fallback;
}

} // namespace extraction

} // namespace doctext

#endif // DOCTEXT_EXTRACTOR_H
