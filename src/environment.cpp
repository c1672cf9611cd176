/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "environment.h"

#include <cstdlib>

namespace doctext::environment
{

std::optional<std::string> get(std::string_view name)
{
	// std::getenv needs a null-terminated name
	const std::string name_str(name);
	if (const char* value = std::getenv(name_str.c_str()))
		return std::string(value);
	return std::nullopt;
}

std::string get_or(std::string_view name, std::string_view fallback)
{
	std::optional<std::string> value = get(name);
	if (!value || value->empty())
		return std::string{fallback};
	return *value;
}

} // namespace doctext::environment
