/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_DIAGNOSTIC_MESSAGE_H
#define DOCTEXT_DIAGNOSTIC_MESSAGE_H

#include "core_export.h"
#include <string>
#include <exception>

namespace doctext::errors
{

/**
 * @brief Generates a diagnostic message for the given nested exceptions chain.
 *
 * The innermost error is printed first, followed by every wrapping error with its location
 * and context items.
 */
DOCTEXT_CORE_EXPORT std::string diagnostic_message(const std::exception& e);

DOCTEXT_CORE_EXPORT std::string diagnostic_message(std::exception_ptr eptr);

} // namespace doctext::errors

#endif // DOCTEXT_DIAGNOSTIC_MESSAGE_H
