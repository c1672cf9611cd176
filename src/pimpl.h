/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_PIMPL_H
#define DOCTEXT_PIMPL_H

#include <memory>
#include <utility>

namespace doctext
{

struct pimpl_impl_base
{
	virtual ~pimpl_impl_base() = default;
};

/**
 * @brief Implementation of class T. Specialized in the source file of T.
 */
template <typename T>
struct pimpl_impl;

/**
 * @brief Base class hiding the implementation details of T behind a pointer.
 *
 * @code
 * class charset_converter : public with_pimpl<charset_converter> { ... };
 *
 * // charset_converter.cpp
 * template<> struct pimpl_impl<charset_converter> : pimpl_impl_base { ... };
 * @endcode
 */
template <typename T>
class with_pimpl
{
protected:
	template <typename... Args>
	explicit with_pimpl(Args&&... args)
		: m_impl(std::make_unique<pimpl_impl<T>>(std::forward<Args>(args)...))
	{}

	with_pimpl(with_pimpl&&) noexcept = default;
	with_pimpl& operator=(with_pimpl&&) noexcept = default;

	pimpl_impl<T>& impl() { return static_cast<pimpl_impl<T>&>(*m_impl); }
	const pimpl_impl<T>& impl() const { return static_cast<const pimpl_impl<T>&>(*m_impl); }

private:
	std::unique_ptr<pimpl_impl_base> m_impl;
};

} // namespace doctext

#endif // DOCTEXT_PIMPL_H
