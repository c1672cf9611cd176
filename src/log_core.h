/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_LOG_CORE_H
#define DOCTEXT_LOG_CORE_H

#include "core_export.h"
#include "serialization_base.h"
#include "source_location.h"
#include <functional>
#include <span>
#include <string>
#include <string_view>

/**
 * @brief Structured logging.
 *
 * - Every record is a structured value (serialized to JSON by the stream sink).
 * - Silent by default: a sink has to be set with `set_sink` and records are passed to it only
 *   when they match the filter set with `set_filter`.
 * - Filter syntax: comma, semicolon or space separated rules. `*` enables everything, a plain
 *   word matches a tag, `@file:` and `@func:` match source file and function names. Wildcards
 *   `*` and `?` are allowed, a leading `-` turns a rule into a deny rule.
 * - In release builds (`NDEBUG`) only entries carrying a persistent tag (`log::audit`) are
 *   compiled in.
 */
namespace doctext::log
{

/**
 * @brief A single log record. Handed to the sink when destroyed.
 */
class DOCTEXT_CORE_EXPORT record
{
public:
	record(source_location location, serialization::array&& context);
	~record();

	record(const record&) = delete;
	record& operator=(const record&) = delete;

	source_location m_location;
	serialization::array m_context;
};

DOCTEXT_CORE_EXPORT void set_filter(const std::string& filter_spec);

DOCTEXT_CORE_EXPORT std::string get_filter();

/**
 * @brief Sets the process-wide callback receiving all enabled log records.
 * @see json_stream_sink
 */
DOCTEXT_CORE_EXPORT void set_sink(std::function<void(const log::record&)> callback);

DOCTEXT_CORE_EXPORT std::function<void(const record&)> get_sink();

/**
 * @brief Creates an object with timestamp, file, line, function and thread_id of a record.
 */
DOCTEXT_CORE_EXPORT serialization::object create_base_metadata(source_location location);

namespace detail
{
DOCTEXT_CORE_EXPORT bool is_enabled(const source_location& location, std::span<const std::string_view> entry_tags);
DOCTEXT_CORE_EXPORT bool is_logging_enabled();
}

} // namespace doctext::log

#endif // DOCTEXT_LOG_CORE_H
