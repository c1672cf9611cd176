/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_LOG_TAGS_H
#define DOCTEXT_LOG_TAGS_H

#include "core_export.h"
#include <string_view>

namespace doctext::log
{

/**
 * @brief Tag for production-worthy operational events.
 *
 * Entries carrying this tag survive release builds. The library itself never uses it; the
 * command-line front end marks each processed file with it.
 *
 * Example: `log_entry(log::audit{}, file_path, encoding);`
 */
struct DOCTEXT_CORE_EXPORT audit { static constexpr std::string_view string() { return "audit"; } };

/// @brief Added to the entry written when a `log_scope` is entered.
struct DOCTEXT_CORE_EXPORT scope_enter { static constexpr std::string_view string() { return "scope_enter"; } };

/// @brief Added to the entry written when a `log_scope` is exited.
struct DOCTEXT_CORE_EXPORT scope_exit { static constexpr std::string_view string() { return "scope_exit"; } };

/// @brief Marks entries describing a spawned external process.
struct DOCTEXT_CORE_EXPORT subprocess { static constexpr std::string_view string() { return "subprocess"; } };

} // namespace doctext::log

#endif // DOCTEXT_LOG_TAGS_H
