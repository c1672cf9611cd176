/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_CONTAINS_TYPE_H
#define DOCTEXT_CONTAINS_TYPE_H

#include "error.h"
#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace doctext::errors
{

namespace detail
{

template <typename T>
const T* context_at(const base& error, size_t index) noexcept
{
	if (error.context_type(index) == typeid(T))
		return static_cast<const T*>(error.context_address(index));
	if (error.context_type(index) == typeid(std::pair<std::string, T>))
		return &static_cast<const std::pair<std::string, T>*>(error.context_address(index))->second;
	return nullptr;
}

} // namespace detail

/**
 * @brief Searches the nested exceptions chain, outermost first, for a context item of type T.
 *
 * Matches both unnamed items (tags, messages) and named items created from variables.
 * @return A copy of the first matching item or std::nullopt.
 */
template <typename T>
std::optional<T> find_context(const std::exception& e)
{
	if (const base* error = dynamic_cast<const base*>(&e))
	{
		for (size_t i = 0; i < error->context_count(); ++i)
		{
			if (const T* item = detail::context_at<T>(*error, i))
				return *item;
		}
	}

	try
	{
		std::rethrow_if_nested(e);
	}
	catch (const std::exception& nested_ex)
	{
		return find_context<T>(nested_ex);
	}
	catch (...)
	{
		// not an std::exception, nothing to search in
	}

	return std::nullopt;
}

/**
 * @brief Checks if the given nested exceptions chain contains a specific type of context.
 *
 * @code
 * catch (const std::exception& e) {
 *   if (errors::contains_type<errors::unsupported_encoding>(e))
 *     ...
 * }
 * @endcode
 */
template <typename T>
bool contains_type(const std::exception& e)
{
	return find_context<T>(e).has_value();
}

} // namespace doctext::errors

#endif // DOCTEXT_CONTAINS_TYPE_H
