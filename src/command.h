/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_COMMAND_H
#define DOCTEXT_COMMAND_H

#include "core_export.h"
#include "serialization_base.h"
#include <string>
#include <variant>
#include <vector>

namespace doctext
{

/**
 * @brief An external command: a shell command line or a program followed by its arguments.
 *
 * A shell command line is run with the system shell (`/bin/sh -c`), so it may use pipes and
 * redirections. An argument vector is run directly, the program is looked up in `PATH` and no
 * argument is interpreted by a shell.
 *
 * @code
 * command{"pdftotext -layout report.pdf -"};
 * command{std::vector<std::string>{"pdftotext", "-layout", path.string(), "-"}};
 * @endcode
 */
struct DOCTEXT_CORE_EXPORT command
{
	std::variant<std::string, std::vector<std::string>> v;

	bool operator==(const command&) const = default;
};

/**
 * @brief Renders the command for diagnostics. Argument vectors are joined with spaces.
 */
DOCTEXT_CORE_EXPORT std::string to_string(const command& cmd);

namespace serialization
{

template <>
struct serializer<command>
{
	value full(const command& cmd) const { return to_string(cmd); }
	value typed_summary(const command& cmd) const { return decorate_with_typeid(full(cmd), type_name::pretty<command>()); }
};

} // namespace serialization

} // namespace doctext

#endif // DOCTEXT_COMMAND_H
