/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_PIPELINE_H
#define DOCTEXT_PIPELINE_H

#include "content.h"
#include "core_export.h"
#include "extractor_registry.h"
#include <filesystem>
#include <functional>
#include <string>

namespace doctext
{

/**
 * @brief Extracts text from a file and returns it in the requested encoding.
 *
 * Stages, in order: select an extractor by file extension, extract, decode to unicode, encode
 * to the target encoding. The first failing stage aborts processing and its error is
 * propagated unchanged. There is no partial output.
 *
 * The extension is taken from the file name (case-insensitive) unless the `extension` option
 * is given. All options are passed to the extractor unmodified.
 *
 * @code
 * byte_sequence text = pipeline{}.process("report.pdf", "UTF-8", {{"layout", "true"}});
 * @endcode
 */
class DOCTEXT_CORE_EXPORT pipeline
{
public:
	/// @brief Uses extractor_registry::default_registry().
	pipeline();

	/// @brief Uses the given registry. The registry must outlive the pipeline.
	explicit pipeline(const extractor_registry& registry);

	/**
	 * @throw errors::base tagged errors::extraction_failed if the file does not exist or its
	 *        extension has no extractor, or errors raised by the extractor, text_decoder and text_encoder.
	 */
	byte_sequence process(const std::filesystem::path& file_path, const std::string& target_encoding, const extraction_options& options = {}) const;

private:
	std::reference_wrapper<const extractor_registry> m_registry;
};

/**
 * @brief Processes the file with the default extractor registry.
 */
DOCTEXT_CORE_EXPORT byte_sequence process(const std::filesystem::path& file_path, const std::string& target_encoding = std::string{default_encoding}, const extraction_options& options = {});

} // namespace doctext

#endif // DOCTEXT_PIPELINE_H
