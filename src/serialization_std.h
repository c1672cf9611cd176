/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_SERIALIZATION_STD_H
#define DOCTEXT_SERIALIZATION_STD_H

#include "core_export.h"
#include <filesystem>
#include <magic_enum/magic_enum.hpp>
#include "serialization_base.h"
#include <thread>
#include <utility>

namespace doctext::serialization
{

template <typename T1, typename T2>
struct serializer<std::pair<T1, T2>>
{
	value full(const std::pair<T1, T2>& pair) const
	{
		return object{{
			{"first", serialization::full(pair.first)},
			{"second", serialization::full(pair.second)}
		}};
	}

	value typed_summary(const std::pair<T1, T2>& pair) const
	{
		return decorate_with_typeid(object{{
			{"first", serialization::typed_summary(pair.first)},
			{"second", serialization::typed_summary(pair.second)}
		}}, type_name::pretty<std::pair<T1, T2>>());
	}
};

template <>
struct serializer<std::filesystem::path>
{
	value full(const std::filesystem::path& p) const
	{
		return p.string();
	}
	value typed_summary(const std::filesystem::path& p) const { return decorate_with_typeid(full(p), type_name::pretty<std::filesystem::path>()); }
};

template <>
struct serializer<std::thread::id>
{
	DOCTEXT_CORE_EXPORT value full(const std::thread::id& i) const;
	value typed_summary(const std::thread::id& i) const { return decorate_with_typeid(full(i), type_name::pretty<std::thread::id>()); }
};

template <typename T> requires std::is_enum_v<T>
struct serializer<T>
{
	value full(const T& value) const { return std::string{magic_enum::enum_name(value)}; }
	value typed_summary(const T& value) const { return decorate_with_typeid(full(value), type_name::pretty<T>()); }
};

} // namespace doctext::serialization

#endif // DOCTEXT_SERIALIZATION_STD_H
