/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_PDF_EXTRACTOR_H
#define DOCTEXT_PDF_EXTRACTOR_H

#include "extractor.h"

namespace doctext
{

/**
 * @brief PDF documents.
 *
 * Option `method` selects the tool:
 * - `pdftotext` (default): poppler `pdftotext`, with `-layout` when option `layout` is `true`,
 * - `pdfminer`: `pdf2txt.py` from pdfminer,
 * - `tesseract`: pages are rendered with `pdftoppm` and recognized one by one with tesseract
 *   (for scanned documents, see image_extractor for the `language` option).
 *
 * Any other method is an error tagged errors::extraction_failed.
 */
class DOCTEXT_CORE_EXPORT pdf_extractor : public extractor
{
public:
	enum class method
	{
		pdftotext,
		pdfminer,
		tesseract
	};

	raw_content extract(const std::filesystem::path& file_path, const extraction_options& options) const override;

	/**
	 * @brief Parses the value of the `method` option. An empty name selects the default.
	 * @throw errors::base tagged errors::extraction_failed for unknown names.
	 */
	static method parse_method(const std::string& name);
};

} // namespace doctext

#endif // DOCTEXT_PDF_EXTRACTOR_H
