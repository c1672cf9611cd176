/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include <boost/program_options.hpp>
#include "charset_converter.h"
#include "diagnostic_message.h"
#include "environment.h"
#include "log_entry.h"
#include "log_json_stream_sink.h"
#include "pipeline.h"
#include "serialization_std.h" // IWYU pragma: keep
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace po = boost::program_options;
using namespace doctext;

namespace
{

constexpr int exit_failure = 1;
constexpr int exit_usage = 2;

struct usage_error : std::runtime_error
{
	using std::runtime_error::runtime_error;
};

extraction_options parse_extraction_options(const std::vector<std::string>& pairs)
{
	extraction_options options;
	for (const std::string& pair : pairs)
	{
		std::string::size_type separator = pair.find('=');
		if (separator == std::string::npos || separator == 0 || pair.find('=', separator + 1) != std::string::npos)
			throw usage_error("Option must have the form KEYWORD=VALUE: " + pair);
		std::string key = pair.substr(0, separator);
		if (!options.emplace(key, pair.substr(separator + 1)).second)
			throw usage_error("Duplicate specification of the key \"" + key + "\" with --option");
	}
	return options;
}

void write_output(const byte_sequence& text, const std::optional<std::string>& output_path)
{
	if (!output_path)
	{
		std::cout.write(text.v.data(), static_cast<std::streamsize>(text.v.size()));
		std::cout.flush();
		return;
	}
	std::ofstream output{*output_path, std::ios::binary | std::ios::trunc};
	if (!output)
		throw usage_error("Cannot open output file: " + *output_path);
	output.write(text.v.data(), static_cast<std::streamsize>(text.v.size()));
}

} // anonymous namespace

int main(int argc, char* argv[])
{
	po::options_description desc("Command line tool for extracting text from any document.\n\nUsage: doctext [options] filename\n\nOptions");
	desc.add_options()
		("help,h", "show this help message and exit")
		("version,v", "show program's version number and exit")
		("encoding,e", po::value<std::string>()->default_value(std::string{default_encoding}), "encoding of the output")
		("method,m", po::value<std::string>()->default_value(""), "method of extraction for formats that support it")
		("output,o", po::value<std::string>(), "output raw text in this file instead of standard output")
		("option,O", po::value<std::vector<std::string>>()->composing(), "arbitrary KEYWORD=VALUE option passed to the extractor, may be repeated")
	;
	po::options_description hidden;
	hidden.add_options()
		("filename", po::value<std::string>(), "file to extract text from")
	;
	po::options_description all;
	all.add(desc).add(hidden);
	po::positional_options_description positional;
	positional.add("filename", 1);

	po::variables_map vm;
	std::string filename;
	std::string encoding;
	extraction_options options;
	try
	{
		po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
		po::notify(vm);

		if (vm.count("help"))
		{
			std::cout << desc << std::endl;
			return 0;
		}
		if (vm.count("version"))
		{
			std::cout << "doctext " << DOCTEXT_VERSION << std::endl;
			return 0;
		}
		if (!vm.count("filename"))
			throw usage_error("the following arguments are required: filename");
		filename = vm["filename"].as<std::string>();
		encoding = vm["encoding"].as<std::string>();
		if (!charset_converter::is_supported(encoding))
			throw usage_error("Unsupported encoding: " + encoding);
		if (vm.count("option"))
			options = parse_extraction_options(vm["option"].as<std::vector<std::string>>());
		std::string method = vm["method"].as<std::string>();
		if (!method.empty())
			options["method"] = method;
	}
	catch (const po::error& e)
	{
		std::cerr << "doctext: error: " << e.what() << std::endl << desc << std::endl;
		return exit_usage;
	}
	catch (const usage_error& e)
	{
		std::cerr << "doctext: error: " << e.what() << std::endl;
		return exit_usage;
	}

	if (std::optional<std::string> log_filter = environment::get(environment::log_filter_variable))
	{
		doctext::log::set_filter(*log_filter);
		doctext::log::set_sink(doctext::log::json_stream_sink(std::cerr));
	}

	try
	{
		log_entry(doctext::log::audit{}, filename, encoding);
		byte_sequence text = process(filename, encoding, options);
		write_output(text, vm.count("output") ? std::optional<std::string>{vm["output"].as<std::string>()} : std::nullopt);
	}
	catch (const usage_error& e)
	{
		std::cerr << "doctext: error: " << e.what() << std::endl;
		return exit_failure;
	}
	catch (const std::exception& e)
	{
		std::cerr << errors::diagnostic_message(e) << std::endl;
		return exit_failure;
	}
	return 0;
}
