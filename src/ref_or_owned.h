/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_REF_OR_OWNED_H
#define DOCTEXT_REF_OR_OWNED_H

#include <concepts>
#include <functional>
#include <memory>
#include <type_traits>
#include <variant>

namespace doctext
{

/**
 * @brief Holds either a reference to an object owned elsewhere or shared ownership of a moved-in object.
 *
 * @code
 * ref_or_owned<std::ostream> a{std::clog};                       // reference
 * ref_or_owned<std::ostream> b{std::ofstream{"log.json"}};       // owned
 * @endcode
 */
template <typename T>
class ref_or_owned
{
public:
	ref_or_owned(T& ref)
		: m_value(std::ref(ref))
	{}

	template <typename U>
	requires std::derived_from<U, T> && (!std::is_lvalue_reference_v<U>)
	ref_or_owned(U&& owned)
		: m_value(std::shared_ptr<T>(std::make_shared<U>(std::move(owned))))
	{}

	T& get() const
	{
		if (const auto* ref = std::get_if<std::reference_wrapper<T>>(&m_value))
			return ref->get();
		return *std::get<std::shared_ptr<T>>(m_value);
	}

private:
	std::variant<std::reference_wrapper<T>, std::shared_ptr<T>> m_value;
};

} // namespace doctext

#endif // DOCTEXT_REF_OR_OWNED_H
