/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_CONCEPTS_H
#define DOCTEXT_CONCEPTS_H

#include <concepts>
#include <iterator>
#include <string_view>
#include <type_traits>
#include <variant>

namespace doctext
{

/**
 * @brief Concept to detect if a type is a container (iterable and not self-recursive).
 */
template<typename T>
concept container = requires(const T& t) {
	{ std::begin(t) } -> std::input_iterator;
	{ std::end(t) } -> std::input_iterator;
	requires !std::is_same_v<std::remove_cvref_t<T>, std::remove_cvref_t<typename std::iterator_traits<decltype(std::begin(t))>::value_type>>;
};

/**
 * @brief Concept for strong type aliases that wrap a single public member `v`.
 * @see byte_sequence, unicode_string, command
 */
template <typename T>
concept strong_type_alias = requires(T value) { value.v; };

/**
 * @brief Concept to detect if a type is dereferenceable like a pointer.
 */
template<typename T>
concept dereferenceable = requires(const T& t) { *t; !t; };

template<typename T>
concept empty = std::is_empty_v<T>;

/**
 * @brief Concept for string-like types that can be converted to a string view.
 */
template<typename T>
concept string_like = std::is_convertible_v<T, std::string_view>;

template <typename T, typename Variant>
struct is_variant_alternative_trait : std::false_type {};

template <typename T, typename... Us>
struct is_variant_alternative_trait<T, std::variant<Us...>> : std::bool_constant<(std::is_same_v<T, Us> || ...)> {};

template <typename T, typename Variant>
concept variant_alternative = is_variant_alternative_trait<T, Variant>::value;

} // namespace doctext

#endif // DOCTEXT_CONCEPTS_H
