/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_ENVIRONMENT_H
#define DOCTEXT_ENVIRONMENT_H

#include "core_export.h"
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Configuration read from environment variables.
 */
namespace doctext::environment
{

/// @brief Filter for the JSON log written to stderr by the command-line tool. Logging stays off when unset.
inline constexpr std::string_view log_filter_variable = "DOCTEXT_LOG_FILTER";

/// @brief OCR language used when the `language` extraction option is absent.
inline constexpr std::string_view tesseract_language_variable = "DOCTEXT_TESSERACT_LANGUAGE";

DOCTEXT_CORE_EXPORT std::optional<std::string> get(std::string_view name);

/**
 * @brief Returns the value of the variable, or the fallback when it is unset or empty.
 */
DOCTEXT_CORE_EXPORT std::string get_or(std::string_view name, std::string_view fallback);

} // namespace doctext::environment

#endif // DOCTEXT_ENVIRONMENT_H
