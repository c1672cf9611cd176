/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_ENSURE_H
#define DOCTEXT_ENSURE_H

#include <cassert>
#include "concepts.h"
#include "source_location.h"
#include <string_view>
#include "throw_if.h"

namespace doctext
{

/**
 * @brief Fluent checks that throw a located error with both compared values on failure.
 *
 * @code
 * ensure(decoded.v) == "Zażółć gęślą jaźń";
 * ensure(result.std_out.size()) >= 8u * 1024 * 1024;
 * ensure(message).contains("unsupported_encoding");
 * @endcode
 *
 * In debug builds the destructor asserts that a comparison was performed, catching
 * `ensure(a == b);` written by mistake.
 *
 * @tparam T The type of the value being checked.
 */
template<typename T>
class [[nodiscard]] ensure
{
public:
	explicit ensure(const T& value, const source_location& loc = source_location::current())
		: m_value(value), m_location(loc)
	{}

	ensure(const ensure&) = delete;
	ensure& operator=(const ensure&) = delete;

	~ensure()
	{
		assert(m_comparison_performed && "ensure() used without a comparison operator");
	}

	template<typename U>
	void operator==(const U& other) const
	{
		m_comparison_performed = true;
		DOCTEXT_THROW_IF_AT_LOCATION(!(m_value == other), m_location, m_value, other);
	}

	template<typename U>
	void operator!=(const U& other) const
	{
		m_comparison_performed = true;
		DOCTEXT_THROW_IF_AT_LOCATION(!(m_value != other), m_location, m_value, other);
	}

	template<typename U>
	void operator>(const U& other) const
	{
		m_comparison_performed = true;
		DOCTEXT_THROW_IF_AT_LOCATION(!(m_value > other), m_location, m_value, other);
	}

	template<typename U>
	void operator>=(const U& other) const
	{
		m_comparison_performed = true;
		DOCTEXT_THROW_IF_AT_LOCATION(!(m_value >= other), m_location, m_value, other);
	}

	template<typename U>
	void operator<(const U& other) const
	{
		m_comparison_performed = true;
		DOCTEXT_THROW_IF_AT_LOCATION(!(m_value < other), m_location, m_value, other);
	}

	/**
	 * @brief Checks that the held string-like value contains the substring.
	 */
	template<typename U>
	requires string_like<T> && string_like<U>
	void contains(const U& substring) const
	{
		m_comparison_performed = true;
		DOCTEXT_THROW_IF_AT_LOCATION(std::string_view(m_value).find(substring) == std::string_view::npos, m_location, m_value, substring);
	}

private:
	const T& m_value;
	source_location m_location;
	mutable bool m_comparison_performed = false;
};

template<typename T>
ensure(const T&, const source_location&) -> ensure<T>;

} // namespace doctext

#endif // DOCTEXT_ENSURE_H
