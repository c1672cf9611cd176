/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_SCOPED_TEMP_H
#define DOCTEXT_SCOPED_TEMP_H

#include "core_export.h"
#include <filesystem>
#include <string_view>

namespace doctext
{

/**
 * @brief A uniquely named, empty file in the system temporary directory, removed on destruction.
 *
 * Removal happens on every exit path of the owning scope, including exceptions thrown by
 * external tools writing to the file.
 */
class DOCTEXT_CORE_EXPORT scoped_temp_file
{
public:
	explicit scoped_temp_file(std::string_view suffix = "");
	~scoped_temp_file();

	scoped_temp_file(const scoped_temp_file&) = delete;
	scoped_temp_file& operator=(const scoped_temp_file&) = delete;

	const std::filesystem::path& path() const { return m_path; }

private:
	std::filesystem::path m_path;
};

/**
 * @brief A uniquely named directory in the system temporary directory, removed recursively on destruction.
 */
class DOCTEXT_CORE_EXPORT scoped_temp_directory
{
public:
	scoped_temp_directory();
	~scoped_temp_directory();

	scoped_temp_directory(const scoped_temp_directory&) = delete;
	scoped_temp_directory& operator=(const scoped_temp_directory&) = delete;

	const std::filesystem::path& path() const { return m_path; }

private:
	std::filesystem::path m_path;
};

} // namespace doctext

#endif // DOCTEXT_SCOPED_TEMP_H
