/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "shell_runner.h"

#include <boost/asio/io_context.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exception.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>
#include <boost/process/shell.hpp>
#include "error_tags.h"
#include <future>
#include "log_scope.h"
#include "make_error.h"

namespace doctext
{

namespace bp = boost::process;

namespace
{

boost::filesystem::path find_program(const std::string& program)
{
	if (program.find('/') != std::string::npos)
		return program;
	boost::filesystem::path program_path = bp::search_path(program);
	if (program_path.empty())
		throw make_error("Program not found", program, errors::extraction_failed{});
	return program_path;
}

bp::child spawn(const command& cmd, boost::asio::io_context& io_context, std::future<std::string>& std_out, std::future<std::string>& std_err)
{
	if (const std::string* command_line = std::get_if<std::string>(&cmd.v))
	{
		return bp::child(bp::exe = bp::shell(), bp::args = std::vector<std::string>{"-c", *command_line},
			bp::std_in.close(), bp::std_out > std_out, bp::std_err > std_err, io_context);
	}
	const std::vector<std::string>& argv = std::get<std::vector<std::string>>(cmd.v);
	if (argv.empty())
		throw make_error("Empty command", errors::extraction_failed{});
	return bp::child(bp::exe = find_program(argv.front()), bp::args = std::vector<std::string>(argv.begin() + 1, argv.end()),
		bp::std_in.close(), bp::std_out > std_out, bp::std_err > std_err, io_context);
}

} // anonymous namespace

process_result shell_runner::run(const command& cmd) const
{
	log_scope(cmd);
	boost::asio::io_context io_context;
	std::future<std::string> std_out;
	std::future<std::string> std_err;
	bp::child child;
	try
	{
		child = spawn(cmd, io_context, std_out, std_err);
	}
	catch (const bp::process_error&)
	{
		std::throw_with_nested(make_error("Cannot start process", cmd, errors::extraction_failed{}));
	}
	// Both pipes are read by the event loop until the child closes them. If anything throws
	// before wait() the child object terminates and reaps the process.
	io_context.run();
	child.wait();

	process_result result{std_out.get(), std_err.get(), child.exit_code()};
	log_entry(log::subprocess{}, result.exit_code, result.std_out.size(), result.std_err.size());
	if (result.exit_code != 0)
	{
		errors::shell_failure failure{cmd, result.exit_code, result.std_out, result.std_err};
		throw make_error("External command failed", failure);
	}
	return result;
}

} // namespace doctext
