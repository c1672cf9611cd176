/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_DIAGNOSTIC_CONTEXT_H
#define DOCTEXT_DIAGNOSTIC_CONTEXT_H

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/punctuation/comma_if.hpp>
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace doctext
{

/**
 * @brief An empty type naming a category of diagnostic context (e.g. `errors::decoding_failed`).
 *
 * Tags travel through errors and log records as themselves, not as name/value pairs.
 */
template <typename T>
concept context_tag = std::is_empty_v<std::remove_cvref_t<T>> && requires { { std::remove_cvref_t<T>::string() } -> std::convertible_to<std::string_view>; };

namespace diagnostic_context
{

/**
 * @brief Creates a context item from a named variable.
 *
 * Captures the expression text and a copy of its value. Context items are stored by value,
 * so they remain valid after the stack unwinds.
 */
template<typename T>
auto make_context_item(const char* name, T&& v) -> std::pair<std::string, std::decay_t<T>>
{
	return {name, std::forward<T>(v)};
}

/// @brief Tags are passed through unnamed.
template <context_tag T>
std::remove_cvref_t<T> make_context_item(const char* name, T&& v)
{
	return std::forward<T>(v);
}

/// @brief String literals are messages, passed through unnamed.
template <size_t N>
const char* make_context_item(const char* name, const char (&v)[N])
{
	return v;
}

} // namespace diagnostic_context

#define DOCTEXT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE_ELEM(r, data, i, elem) \
	BOOST_PP_COMMA_IF(i) doctext::diagnostic_context::make_context_item(BOOST_PP_STRINGIZE(elem), elem)

/**
 * @brief Expands `a, b, "msg"` into `make_context_item("a", a), make_context_item("b", b), ...`.
 */
#define DOCTEXT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(...) \
	__VA_OPT__(BOOST_PP_SEQ_FOR_EACH_I(DOCTEXT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE_ELEM, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)))

#define DOCTEXT_DIAGNOSTIC_CONTEXT_GET_TYPE_ELEM(r, data, i, elem) \
	BOOST_PP_COMMA_IF(i) decltype(doctext::diagnostic_context::make_context_item(BOOST_PP_STRINGIZE(elem), elem))

#define DOCTEXT_DIAGNOSTIC_CONTEXT_GET_TYPES(...) \
	__VA_OPT__(BOOST_PP_SEQ_FOR_EACH_I(DOCTEXT_DIAGNOSTIC_CONTEXT_GET_TYPE_ELEM, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)))

} // namespace doctext

#endif // DOCTEXT_DIAGNOSTIC_CONTEXT_H
