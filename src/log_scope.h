/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_LOG_SCOPE_H
#define DOCTEXT_LOG_SCOPE_H

#include <boost/preprocessor/cat.hpp>
#include "log_entry.h"
#include <optional> // IWYU pragma: keep

namespace doctext::log::detail
{

/**
 * @brief Writes a `scope_enter` entry when created and a `scope_exit` entry when destroyed,
 * both carrying the same context items.
 */
template <typename... Args>
class scope
{
public:
	scope(source_location location, std::tuple<Args...>&& args_tuple)
		: m_location(location), m_args_tuple(std::move(args_tuple))
	{
		log::entry(m_location, std::tuple_cat(std::make_tuple(log::scope_enter{}), m_args_tuple));
	}

	scope(const scope&) = delete;
	scope& operator=(const scope&) = delete;

	~scope() noexcept
	{
		try
		{
			log::entry(m_location, std::tuple_cat(std::make_tuple(log::scope_exit{}), m_args_tuple));
		}
		catch (const std::exception&)
		{
			// the scope may be unwinding because of another exception
		}
	}

private:
	source_location m_location;
	std::tuple<Args...> m_args_tuple;
};

} // namespace doctext::log::detail

#define DOCTEXT_LOG_SCOPE_OBJECT_TYPE(...) \
	std::optional<doctext::log::detail::scope<DOCTEXT_DIAGNOSTIC_CONTEXT_GET_TYPES(__VA_ARGS__)>>

#ifdef NDEBUG
	#define DOCTEXT_LOG_SCOPE(...) \
		[[maybe_unused]] DOCTEXT_LOG_SCOPE_OBJECT_TYPE(__VA_ARGS__) BOOST_PP_CAT(doctext_log_scope_object_at_line_, __LINE__); \
		if constexpr (doctext::log::detail::should_log_in_release<doctext::log::scope_enter __VA_OPT__(,) DOCTEXT_LOG_GET_TYPES(__VA_ARGS__)>()) { \
			if (doctext::log::detail::is_logging_enabled()) \
				BOOST_PP_CAT(doctext_log_scope_object_at_line_, __LINE__).emplace(doctext::source_location::current(), std::make_tuple(DOCTEXT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__))); \
		}
#else
	#define DOCTEXT_LOG_SCOPE(...) \
		[[maybe_unused]] DOCTEXT_LOG_SCOPE_OBJECT_TYPE(__VA_ARGS__) BOOST_PP_CAT(doctext_log_scope_object_at_line_, __LINE__); \
		if (doctext::log::detail::is_logging_enabled()) \
			BOOST_PP_CAT(doctext_log_scope_object_at_line_, __LINE__).emplace(doctext::source_location::current(), std::make_tuple(DOCTEXT_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__)));
#endif

#ifdef DOCTEXT_ENABLE_SHORT_MACRO_NAMES
	#define log_scope(...) DOCTEXT_LOG_SCOPE(__VA_ARGS__)
#endif

#endif // DOCTEXT_LOG_SCOPE_H
