/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_STRINGIFICATION_H
#define DOCTEXT_STRINGIFICATION_H

#include "diagnostic_context.h"
#include "json_serialization.h"
#include "serialization_std.h" // IWYU pragma: keep
#include <string>
#include <type_traits>
#include <utility>

namespace doctext
{

template <typename T>
struct is_named_context_item : std::false_type {};

template <typename T>
struct is_named_context_item<std::pair<std::string, T>> : std::true_type {};

/**
 * @brief Renders a diagnostic context item as human readable text.
 *
 * Tags render as their name, named items as `name: value`, strings verbatim and everything
 * else as compact JSON produced by the serialization framework.
 */
template <typename T>
std::string stringify(const T& value)
{
	if constexpr (context_tag<T>)
		return std::string{T::string()};
	else if constexpr (is_named_context_item<T>::value)
		return value.first + ": " + stringify(value.second);
	else if constexpr (string_like<T>)
	{
		if constexpr (std::is_pointer_v<std::decay_t<T>>)
		{
			if (value == nullptr)
				return "null";
		}
		return std::string{std::string_view{value}};
	}
	else
	{
		serialization::value s_val = serialization::full(value);
		if (const std::string* str = std::get_if<std::string>(&s_val))
			return *str;
		return serialization::to_json(s_val);
	}
}

} // namespace doctext

#endif // DOCTEXT_STRINGIFICATION_H
