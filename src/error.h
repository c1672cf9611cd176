/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_ERROR_H
#define DOCTEXT_ERROR_H

#include "core_export.h"
#include "diagnostic_context.h" // IWYU pragma: keep
#include <exception>
#include "stringification.h"
#include "source_location.h"
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>

/**
 * @brief Reporting and handling errors with context data using nested exceptions.
 *
 * Every failure surfaced by the pipeline is an `errors::base`. The kind of failure is carried
 * as a context item (a tag such as `errors::decoding_failed` or a structured item such as
 * `errors::shell_failure`) and is queried with `errors::contains_type` and `errors::find_context`.
 */
namespace doctext::errors
{

/**
 * @brief Base class for all exceptions thrown by doctext.
 *
 * Holds the source location where the error was created and an arbitrary number of context
 * items of any type: messages, name/value pairs or tags.
 *
 * @note what() never formats the context. Context may contain fragments of processed documents,
 *       so the full message is only produced on request by errors::diagnostic_message.
 *
 * @code
 * try {
 *   doctext::process("report.pdf", "UTF-8", {});
 * } catch (const doctext::errors::base& e) {
 *   for (size_t i = 0; i < e.context_count(); ++i)
 *     std::cerr << e.context_string(i) << std::endl;
 *   std::cerr << errors::diagnostic_message(e) << std::endl;
 * }
 * @endcode
 *
 * @see errors::impl
 * @see make_error
 * @see errors::diagnostic_message
 */
struct DOCTEXT_CORE_EXPORT base : public std::exception
{
	/// @brief The source location where the exception was created.
	source_location location;

	base(const source_location& location = source_location::current());

	/**
	 * @brief Get the type information of the context item at the given index.
	 */
	virtual std::type_info const& context_type(size_t index) const noexcept = 0;

	/**
	 * @brief Get the address of the context item at the given index.
	 *
	 * The pointer refers to an object of the type reported by context_type(index).
	 */
	virtual const void* context_address(size_t index) const noexcept = 0;

	/**
	 * @brief Get the string representation of the context item at the given index.
	 */
	virtual std::string context_string(size_t index) const = 0;

	virtual size_t context_count() const noexcept = 0;

	/**
	 * @brief Returns the leading message literal if there is one, otherwise the error type.
	 */
	virtual const char* what() const noexcept override;
};

/**
 * @brief Error class for a variadic number of context items.
 *
 * Use the make_error macro instead of constructing impl directly; it captures the names of the
 * context variables and the source location.
 *
 * @code
 * throw make_error("Program not found", program, errors::extraction_failed{});
 * @endcode
 *
 * @tparam T The types of the context items.
 */
template <typename... T>
struct impl : public base
{
private:
	template<size_t I>
	std::string context_string_impl() const
	{
		return stringify(std::get<I>(context));
	}

	template<size_t I>
	const std::type_info& context_type_impl() const noexcept
	{
		return typeid(std::get<I>(context));
	}

	template<size_t I>
	const void* context_address_impl() const noexcept
	{
		return &std::get<I>(context);
	}

	template <size_t... Is>
	std::string context_string_at(size_t index, std::index_sequence<Is...>) const {
		using FuncType = std::string(impl::*)() const;
		static constexpr FuncType funcs[] = { &impl::template context_string_impl<Is>... };
		return (this->*funcs[index])();
	}

	template <size_t... Is>
	const std::type_info& context_type_at(size_t index, std::index_sequence<Is...>) const noexcept {
		using FuncType = const std::type_info&(impl::*)() const noexcept;
		static constexpr FuncType funcs[] = { &impl::template context_type_impl<Is>... };
		return (this->*funcs[index])();
	}

	template <size_t... Is>
	const void* context_address_at(size_t index, std::index_sequence<Is...>) const noexcept {
		using FuncType = const void*(impl::*)() const noexcept;
		static constexpr FuncType funcs[] = { &impl::template context_address_impl<Is>... };
		return (this->*funcs[index])();
	}

public:
	/**
	 * @brief All context items provided when the error was created.
	 */
	std::tuple<T...> context;

	explicit impl(const std::tuple<T...>& context_tuple, const source_location& location = source_location::current())
		: base(location), context(context_tuple)
	{
	}

	std::type_info const& context_type(size_t index) const noexcept override
	{
		return context_type_at(index, std::make_index_sequence<sizeof...(T)>{});
	}

	const void* context_address(size_t index) const noexcept override
	{
		return context_address_at(index, std::make_index_sequence<sizeof...(T)>{});
	}

	std::string context_string(size_t index) const override
	{
		return context_string_at(index, std::make_index_sequence<sizeof...(T)>{});
	}

	size_t context_count() const noexcept override
	{
		return sizeof...(T);
	}

	const char* what() const noexcept override
	{
		if constexpr (sizeof...(T) > 0)
		{
			if constexpr (std::is_same_v<std::tuple_element_t<0, std::tuple<T...>>, const char*>)
				return std::get<0>(context);
		}
		return base::what();
	}
};

} // namespace doctext::errors

#endif // DOCTEXT_ERROR_H
