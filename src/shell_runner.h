/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_SHELL_RUNNER_H
#define DOCTEXT_SHELL_RUNNER_H

#include "command.h"
#include "core_export.h"
#include "process_result.h"

namespace doctext
{

/**
 * @brief Runs external commands synchronously and captures their output.
 *
 * stdin of the child is closed. stdout and stderr are drained concurrently while the child
 * runs, so commands writing more than the pipe buffer size never block the caller.
 * There is no timeout: a hanging child hangs the caller.
 *
 * @code
 * process_result result = shell_runner{}.run(command{"pdftotext report.pdf -"});
 * @endcode
 */
class DOCTEXT_CORE_EXPORT shell_runner
{
public:
	/**
	 * @brief Runs the command and waits for it to finish.
	 *
	 * @throw errors::base carrying errors::shell_failure if the command exits with a non-zero status.
	 * @throw errors::base tagged errors::extraction_failed if the program cannot be found or started.
	 */
	process_result run(const command& cmd) const;
};

} // namespace doctext

#endif // DOCTEXT_SHELL_RUNNER_H
