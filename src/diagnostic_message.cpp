/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "diagnostic_message.h"
#include "error.h"

namespace doctext::errors
{

namespace
{

std::string quote(const std::string& s)
{
	return "\"" + s + "\"";
}

std::string location_lines(const base& error, const std::string& prefix)
{
	return prefix + std::string{error.location.function_name()} + "\n" +
		"at " + std::string{error.location.file_name()} + ":" + std::to_string(error.location.line()) + "\n";
}

} // anonymous namespace

std::string diagnostic_message(const std::exception& e)
{
	std::string message;
	try
	{
		std::rethrow_if_nested(e);
	}
	catch (const std::exception& nested_ex)
	{
		message = diagnostic_message(nested_ex);
	}
	catch (...)
	{
		message = "Unknown error\n";
	}

	const base* error = dynamic_cast<const base*>(&e);
	if (!error)
	{
		message += "Error: " + quote(e.what()) + "\n";
		message += "No location information available\n";
		return message;
	}
	if (message.empty())
	{
		message += "Error: " + (error->context_count() > 0 ? quote(error->context_string(0)) : quote(e.what())) + "\n";
		message += location_lines(*error, "in ");
		for (size_t i = 1; i < error->context_count(); ++i)
			message += "with context " + quote(error->context_string(i)) + "\n";
	}
	else
	{
		message += location_lines(*error, "wrapping at: ");
		for (size_t i = 0; i < error->context_count(); ++i)
			message += "with context " + quote(error->context_string(i)) + "\n";
	}
	return message;
}

std::string diagnostic_message(std::exception_ptr eptr)
{
	try
	{
		std::rethrow_exception(eptr);
	}
	catch (const std::exception& e)
	{
		return diagnostic_message(e);
	}
	catch (...)
	{
		return "Unknown error\n";
	}
}

} // namespace doctext::errors
