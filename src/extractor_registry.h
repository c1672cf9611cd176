/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_EXTRACTOR_REGISTRY_H
#define DOCTEXT_EXTRACTOR_REGISTRY_H

#include "core_export.h"
#include "extractor.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace doctext
{

using extractor_factory = std::function<std::unique_ptr<extractor>()>;

/**
 * @brief Read-only table mapping file extensions to extractor factories.
 *
 * Extensions are stored lower-case with a leading dot (`.pdf`). Lookups accept any case and
 * an optional leading dot.
 *
 * @code
 * extractor_registry registry{{{".txt", [] { return std::make_unique<txt_extractor>(); }}}};
 * std::unique_ptr<extractor> e = registry.create("TXT");
 * @endcode
 */
class DOCTEXT_CORE_EXPORT extractor_registry
{
public:
	explicit extractor_registry(const std::map<std::string, extractor_factory>& factories);

	/**
	 * @brief The table of extractors shipped with doctext. Initialized on first use.
	 */
	static const extractor_registry& default_registry();

	/**
	 * @throw errors::base tagged errors::extraction_failed if no extractor handles the extension.
	 */
	std::unique_ptr<extractor> create(const std::string& extension) const;

	bool contains(const std::string& extension) const;

	std::vector<std::string> extensions() const;

	/**
	 * @brief Lower-cases the extension and prepends a dot if missing.
	 */
	static std::string normalize_extension(const std::string& extension);

private:
	std::map<std::string, extractor_factory> m_factories;
};

} // namespace doctext

#endif // DOCTEXT_EXTRACTOR_REGISTRY_H
