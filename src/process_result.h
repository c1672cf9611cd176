/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_PROCESS_RESULT_H
#define DOCTEXT_PROCESS_RESULT_H

#include <string>

namespace doctext
{

/**
 * @brief Captured output of a finished external process.
 *
 * std_out and std_err hold raw bytes as written by the process.
 */
struct process_result
{
	std::string std_out;
	std::string std_err;
	int exit_code;
};

} // namespace doctext

#endif // DOCTEXT_PROCESS_RESULT_H
