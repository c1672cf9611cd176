/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_IMAGE_EXTRACTOR_H
#define DOCTEXT_IMAGE_EXTRACTOR_H

#include "extractor.h"
#include <string>

namespace doctext
{

/**
 * @brief Raster images, recognized with the `tesseract` OCR engine.
 *
 * Option `language` selects the tesseract language pack (e.g. `eng`, `pol+eng`). When it is
 * absent the DOCTEXT_TESSERACT_LANGUAGE environment variable is used, and when that is unset
 * too tesseract runs with its own default.
 */
class DOCTEXT_CORE_EXPORT image_extractor : public extractor
{
public:
	raw_content extract(const std::filesystem::path& file_path, const extraction_options& options) const override;
};

namespace extraction
{

/**
 * @brief Runs tesseract on a single image and returns the recognized text as written by tesseract.
 */
DOCTEXT_CORE_EXPORT std::string recognize_image(const std::filesystem::path& image_path, const extraction_options& options);

} // namespace extraction

} // namespace doctext

#endif // DOCTEXT_IMAGE_EXTRACTOR_H
