/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_LOG_ENTRY_H
#define DOCTEXT_LOG_ENTRY_H

#include "diagnostic_context.h"
#include "log_core.h"
#include "log_tags.h"
#include "serialization_std.h" // IWYU pragma: keep
#include "stringification.h"
#include <tuple>
#include <type_traits>
#include <vector>

namespace doctext::log
{

namespace detail
{

template <typename T>
struct is_persistent_tag : std::false_type {};

template <>
struct is_persistent_tag<audit> : std::true_type {};

/**
 * @brief True if at least one of the context item types survives release builds.
 */
template <typename... Args>
constexpr bool should_log_in_release()
{
	return (is_persistent_tag<std::remove_cvref_t<Args>>::value || ...);
}

template <typename T>
void append_tag(std::vector<std::string_view>& tags, const T&)
{
	if constexpr (context_tag<T>)
		tags.push_back(T::string());
}

template <typename T>
serialization::value to_log_value(const T& item)
{
	if constexpr (context_tag<T>)
		return serialization::object{{{"tag", std::string{T::string()}}}};
	else if constexpr (is_named_context_item<T>::value)
		return serialization::object{{{item.first, serialization::full(item.second)}}};
	else if constexpr (serialization::value_alternative<T>)
		return item;
	else
		return serialization::full(item);
}

} // namespace detail

/**
 * @brief Writes a record built from the given context items if the filter enables it.
 *
 * Called by the `log_entry` and `log_scope` macros. Tags among the items take part in filtering.
 */
template <typename... Args>
void entry(source_location location, const std::tuple<Args...>& items)
{
	std::vector<std::string_view> tags;
	std::apply([&](const auto&... item) { (detail::append_tag(tags, item), ...); }, items);
	if (!detail::is_enabled(location, tags))
		return;
	serialization::array context;
	std::apply([&](const auto&... item) { (context.v.push_back(detail::to_log_value(item)), ...); }, items);
	record rec{location, std::move(context)};
}

} // namespace doctext::log

#define DOCTEXT_LOG_GET_TYPES(...) DOCTEXT_DIAGNOSTIC_CONTEXT_GET_TYPES(__VA_ARGS__)

#ifdef NDEBUG
	#define DOCTEXT_LOG_ENTRY(...) \
		do { \
			if constexpr (doctext::log::detail::should_log_in_release<DOCTEXT_LOG_GET_TYPES(__VA_ARGS__)>()) { \
				if (doctext::log::detail::is_logging_enabled()) \
					doctext::log::entry(doctext::source_location::current(), std::make_tuple(DOCTEXT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__))); \
			} \
		} while (false)
#else
	#define DOCTEXT_LOG_ENTRY(...) \
		do { \
			if (doctext::log::detail::is_logging_enabled()) \
				doctext::log::entry(doctext::source_location::current(), std::make_tuple(DOCTEXT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__))); \
		} while (false)
#endif

#ifdef DOCTEXT_ENABLE_SHORT_MACRO_NAMES
	#define log_entry(...) DOCTEXT_LOG_ENTRY(__VA_ARGS__)
#endif

#endif // DOCTEXT_LOG_ENTRY_H
