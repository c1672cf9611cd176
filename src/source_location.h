/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_SOURCE_LOCATION_H
#define DOCTEXT_SOURCE_LOCATION_H

#include <source_location>

namespace doctext
{

/// @brief Location in source code captured by errors, log records and `ensure` checks.
using source_location = std::source_location;

} // namespace doctext

#endif // DOCTEXT_SOURCE_LOCATION_H
