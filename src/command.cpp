/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "command.h"

#include <boost/algorithm/string/join.hpp>

namespace doctext
{

std::string to_string(const command& cmd)
{
	if (const std::string* command_line = std::get_if<std::string>(&cmd.v))
		return *command_line;
	return boost::algorithm::join(std::get<std::vector<std::string>>(cmd.v), " ");
}

} // namespace doctext
