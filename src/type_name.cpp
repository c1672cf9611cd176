/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "type_name.h"
#include <boost/algorithm/string.hpp>
#include <boost/core/demangle.hpp>

namespace doctext::type_name
{

namespace
{

/**
 * @brief Removes compiler and standard library artifacts from demangled names.
 */
std::string normalize_name(const std::string& name)
{
	std::string normalized = name;
	boost::algorithm::erase_all(normalized, "virtual ");
	boost::algorithm::erase_all(normalized, "class ");
	boost::algorithm::erase_all(normalized, "struct ");
	boost::algorithm::replace_all(normalized, "::__cxx11", ""); // libstdc++ ABI tag
	boost::algorithm::replace_all(normalized, "std::__1::", "std::"); // libc++ inline namespace
	boost::algorithm::replace_all(normalized, "std::__fs::", "std::");
	boost::algorithm::replace_all(normalized, "(void)", "()");
	boost::algorithm::replace_all(normalized, ", ", ",");
	boost::algorithm::replace_all(normalized, " >", ">");
	return normalized;
}

} // anonymous namespace

std::string from_type_index(std::type_index t)
{
	return normalize_name(boost::core::demangle(t.name()));
}

std::string pretty_function(const std::string& function_name)
{
	return normalize_name(function_name);
}

} // namespace doctext::type_name
