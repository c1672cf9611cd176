/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "scoped_temp.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include "log_entry.h"
#include "make_error.h"
#include "serialization_std.h" // IWYU pragma: keep
#include "throw_if.h"
#include <unistd.h>
#include <vector>

namespace doctext
{

namespace
{

std::vector<char> make_template(std::string_view suffix)
{
	std::string pattern = (std::filesystem::temp_directory_path() / "doctext-XXXXXX").string();
	pattern += suffix;
	return std::vector<char>(pattern.c_str(), pattern.c_str() + pattern.size() + 1);
}

void remove_quietly(const std::filesystem::path& path)
{
	std::error_code ec;
	std::filesystem::remove_all(path, ec);
	if (ec)
		log_entry("Cannot remove temporary path", path, ec.message());
}

} // anonymous namespace

scoped_temp_file::scoped_temp_file(std::string_view suffix)
{
	std::vector<char> name = make_template(suffix);
	int fd = mkstemps(name.data(), static_cast<int>(suffix.size()));
	throw_if(fd == -1, std::string{std::strerror(errno)});
	::close(fd);
	m_path = name.data();
	log_entry(m_path);
}

scoped_temp_file::~scoped_temp_file()
{
	remove_quietly(m_path);
}

scoped_temp_directory::scoped_temp_directory()
{
	std::vector<char> name = make_template("");
	throw_if(mkdtemp(name.data()) == nullptr, std::string{std::strerror(errno)});
	m_path = name.data();
	log_entry(m_path);
}

scoped_temp_directory::~scoped_temp_directory()
{
	remove_quietly(m_path);
}

} // namespace doctext
