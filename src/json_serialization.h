/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_JSON_SERIALIZATION_H
#define DOCTEXT_JSON_SERIALIZATION_H

#include "core_export.h"
#include "serialization_base.h"

namespace doctext::serialization
{

/**
 * @brief Converts a `doctext::serialization::value` to a compact JSON string.
 *
 * Used for stringification of error context items and by the JSON log sink.
 */
DOCTEXT_CORE_EXPORT std::string to_json(const value& s_val);

} // namespace doctext::serialization

#endif // DOCTEXT_JSON_SERIALIZATION_H
