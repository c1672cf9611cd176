/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_TYPE_NAME_H
#define DOCTEXT_TYPE_NAME_H

#include "core_export.h"
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <variant>
#include <vector>

/**
 * @brief Human readable, platform independent names of C++ types.
 *
 * Used by the serialization framework to decorate typed summaries and by the log framework
 * to print function names without compiler-specific noise.
 */
namespace doctext::type_name
{

DOCTEXT_CORE_EXPORT std::string from_type_index(std::type_index t);

template<typename T>
struct pretty_impl {
	std::string operator()() const {
		return from_type_index(typeid(T));
	}
};

template<>
struct pretty_impl<std::string> {
	std::string operator()() const { return "std::string"; }
};

template<typename T>
std::string pretty();

template<typename T>
struct pretty_impl<const T> {
	std::string operator()() const {
		return "const " + pretty<T>();
	}
};

template<typename T>
struct pretty_impl<T&> {
	std::string operator()() const {
		return pretty<std::remove_reference_t<T>>() + "&";
	}
};

template<typename T>
struct pretty_impl<const T&> {
	std::string operator()() const {
		return pretty<std::add_const_t<std::remove_reference_t<T>>>() + "&";
	}
};

template<typename T, typename Alloc>
struct pretty_impl<std::vector<T, Alloc>> {
	std::string operator()() const { return "std::vector<" + pretty<T>() + ">"; }
};

template<typename Key, typename T, typename Compare, typename Alloc>
struct pretty_impl<std::map<Key, T, Compare, Alloc>> {
	std::string operator()() const { return "std::map<" + pretty<Key>() + "," + pretty<T>() + ">"; }
};

template<typename T1, typename T2>
struct pretty_impl<std::pair<T1, T2>> {
	std::string operator()() const { return "std::pair<" + pretty<T1>() + "," + pretty<T2>() + ">"; }
};

template<typename T>
struct pretty_impl<std::optional<T>> {
	std::string operator()() const { return "std::optional<" + pretty<T>() + ">"; }
};

template<typename T, typename... Ts>
struct pretty_impl<std::variant<T, Ts...>> {
	std::string operator()() const { return "std::variant<" + (pretty<T>() + ... + ("," + pretty<Ts>())) + ">"; }
};

template<typename T>
inline std::string pretty() { return pretty_impl<T>{}(); }

DOCTEXT_CORE_EXPORT std::string pretty_function(const std::string& function_name);

} // namespace doctext::type_name

#endif // DOCTEXT_TYPE_NAME_H
