/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "extractor_registry.h"

#include <boost/algorithm/string/case_conv.hpp>
#include "doc_extractor.h"
#include "error_tags.h"
#include "image_extractor.h"
#include "make_error.h"
#include "pdf_extractor.h"
#include "ps_extractor.h"
#include "rtf_extractor.h"
#include "txt_extractor.h"

namespace doctext
{

namespace
{

template <typename T>
extractor_factory factory_of()
{
	return [] { return std::make_unique<T>(); };
}

std::map<std::string, extractor_factory> default_factories()
{
	return {
		{".txt", factory_of<txt_extractor>()},
		{".pdf", factory_of<pdf_extractor>()},
		{".png", factory_of<image_extractor>()},
		{".jpg", factory_of<image_extractor>()},
		{".jpeg", factory_of<image_extractor>()},
		{".gif", factory_of<image_extractor>()},
		{".tif", factory_of<image_extractor>()},
		{".tiff", factory_of<image_extractor>()},
		{".bmp", factory_of<image_extractor>()},
		{".doc", factory_of<doc_extractor>()},
		{".ps", factory_of<ps_extractor>()},
		{".rtf", factory_of<rtf_extractor>()}
	};
}

} // anonymous namespace

extractor_registry::extractor_registry(const std::map<std::string, extractor_factory>& factories)
{
	for (const auto& [extension, factory] : factories)
		m_factories.emplace(normalize_extension(extension), factory);
}

const extractor_registry& extractor_registry::default_registry()
{
	static const extractor_registry registry{default_factories()};
	return registry;
}

std::unique_ptr<extractor> extractor_registry::create(const std::string& extension) const
{
	std::string normalized = normalize_extension(extension);
	auto it = m_factories.find(normalized);
	if (it == m_factories.end())
		throw make_error("No extractor for file extension", normalized, errors::extraction_failed{});
	return it->second();
}

bool extractor_registry::contains(const std::string& extension) const
{
	return m_factories.contains(normalize_extension(extension));
}

std::vector<std::string> extractor_registry::extensions() const
{
	std::vector<std::string> result;
	result.reserve(m_factories.size());
	for (const auto& entry : m_factories)
		result.push_back(entry.first);
	return result;
}

std::string extractor_registry::normalize_extension(const std::string& extension)
{
	std::string normalized = boost::algorithm::to_lower_copy(extension);
	if (!normalized.starts_with('.'))
		normalized.insert(normalized.begin(), '.');
	return normalized;
}

} // namespace doctext
