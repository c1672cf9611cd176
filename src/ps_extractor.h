/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_PS_EXTRACTOR_H
#define DOCTEXT_PS_EXTRACTOR_H

#include "extractor.h"

namespace doctext
{

/**
 * @brief PostScript documents, converted with `ps2ascii` from Ghostscript.
 */
class DOCTEXT_CORE_EXPORT ps_extractor : public extractor
{
public:
	raw_content extract(const std::filesystem::path& file_path, const extraction_options& options) const override;
};

} // namespace doctext

#endif // DOCTEXT_PS_EXTRACTOR_H
