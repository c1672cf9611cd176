/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_SERIALIZATION_BASE_H
#define DOCTEXT_SERIALIZATION_BASE_H

#include "concepts.h"
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include "type_name.h"

namespace doctext
{

/**
 * @brief Generic, concept-based conversion of C++ values into a structured representation.
 *
 * The core of the framework is `doctext::serialization::value`, a `std::variant` that can hold
 * primitive types, arrays or objects. Support for a new type is added by specializing
 * `doctext::serialization::serializer`.
 *
 * Used by the logging framework and the error framework to capture variables for diagnostics.
 */
namespace serialization
{

struct object;
struct array;

using value = std::variant<
	std::nullptr_t,
	bool,
	std::int64_t,
	std::uint64_t,
	double,
	std::string,
	array,
	object
>;

struct array { std::vector<value> v; };

struct object { std::map<std::string, value> v; };

inline value decorate_with_typeid(const value& base_val, const std::string& typeid_str)
{
	return object{{
		{"typeid", typeid_str},
		{"value", base_val}
	}};
}

template <typename T> value full(const T& value);

/**
 * @brief Primary template for the serializer.
 *
 * Specializations provide `full` (untyped) and `typed_summary` (decorated with the type name).
 */
template <typename T>
struct serializer;

template <typename T>
value full(const T& value) { return serializer<T>{}.full(value); }

template <typename T>
value typed_summary(const T& value)
{
	return serializer<T>{}.typed_summary(value);
}

template <typename T>
concept value_alternative = variant_alternative<T, value>;

template <value_alternative T>
struct serializer<T>
{
	value full(const T& value) const { return value; }

	value typed_summary(const T& value) const {
		return decorate_with_typeid(this->full(value), type_name::pretty<T>());
	}
};

template <typename T> requires(std::is_arithmetic_v<T> && !value_alternative<T>)
struct serializer<T>
{
	value full(const T& value) const
	{
		if constexpr (std::is_integral_v<T> && std::is_signed_v<T>)
			return static_cast<std::int64_t>(value);
		else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>)
			return static_cast<std::uint64_t>(value);
		else
			return static_cast<double>(value);
	}

	value typed_summary(const T& value) const {
		return decorate_with_typeid(this->full(value), type_name::pretty<T>());
	}
};

template <typename T> requires string_like<T> && (!value_alternative<T>)
struct serializer<T>
{
	value full(const T& val) const
	{
		if constexpr (std::is_pointer_v<std::decay_t<T>>) {
			if (val == nullptr) {
				return nullptr;
			}
		}
		return std::string(val);
	}
	value typed_summary(const T& val) const { return decorate_with_typeid(this->full(val), type_name::pretty<T>()); }
};

/**
 * @brief Specialization for strong type aliases.
 *
 * `array` and `object` also carry a `v` member but are handled as value alternatives.
 */
template <strong_type_alias T> requires (!value_alternative<T>)
struct serializer<T>
{
	value full(const T& value) const { return serialization::full(value.v); }
	value typed_summary(const T& value) const { return decorate_with_typeid(full(value), type_name::pretty<T>()); }
};

template <empty T>
struct serializer<T>
{
	value full(const T& val) const { return object{}; }
	value typed_summary(const T& val) const { return decorate_with_typeid(this->full(val), type_name::pretty<T>()); }
};

/**
 * @brief Specialization for pointers, smart pointers and optionals.
 *
 * Serializes to `nullptr` when empty, otherwise serializes the dereferenced object.
 */
template <typename T>
requires (dereferenceable<T> && !container<T> && !string_like<T> && !value_alternative<T>)
struct serializer<T>
{
	value full(const T& dereferenceable) const
	{
		if (dereferenceable) {
			return object{{{"value", serialization::full(*dereferenceable)}}};
		}
		return nullptr;
	}

	value typed_summary(const T& dereferenceable) const {
		if (dereferenceable) {
			return object{{
				{"typeid", type_name::pretty<T>()},
				{"value", serialization::typed_summary(*dereferenceable)}
			}};
		}
		return decorate_with_typeid(nullptr, type_name::pretty<T>());
	}
};

/**
 * @brief Specialization for iterable types (e.g. std::vector, std::map).
 */
template <typename T> requires (container<T> && !string_like<T> && !value_alternative<T>)
struct serializer<T>
{
	value full(const T& container) const
	{
		array arr;
		for (const auto& item : container) { arr.v.push_back(serialization::full(item)); }
		return arr;
	}

	value typed_summary(const T& container) const
	{
		array arr;
		for (const auto& item : container)
		{
			arr.v.push_back(serialization::typed_summary(item));
		}
		return decorate_with_typeid(arr, type_name::pretty<T>());
	}
};

/**
 * @brief Specialization for std::variant.
 *
 * Serializes the active alternative wrapped in an object.
 */
template<typename... Ts>
struct serializer<std::variant<Ts...>>
{
	value full(const std::variant<Ts...>& variant) const
	{
		return std::visit([](const auto& value) -> serialization::value {
			return object{{{"value", serialization::full(value)}}};
		}, variant);
	}

	value typed_summary(const std::variant<Ts...>& variant) const { return decorate_with_typeid(this->full(variant), type_name::pretty<std::variant<Ts...>>()); }
};

} // namespace serialization

} // namespace doctext

#endif // DOCTEXT_SERIALIZATION_BASE_H
