/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "pdf_extractor.h"

#include <algorithm>
#include "error_tags.h"
#include "image_extractor.h"
#include "log_scope.h"
#include <magic_enum/magic_enum.hpp>
#include "make_error.h"
#include <optional>
#include "scoped_temp.h"
#include "serialization_std.h" // IWYU pragma: keep
#include "shell_runner.h"
#include "throw_if.h"
#include <vector>

namespace doctext
{

namespace
{

std::string run_pdftotext(const std::filesystem::path& file_path, bool layout)
{
	std::vector<std::string> argv{"pdftotext"};
	if (layout)
		argv.push_back("-layout");
	argv.push_back(file_path.string());
	argv.push_back("-");
	return shell_runner{}.run(command{std::move(argv)}).std_out;
}

std::string run_pdfminer(const std::filesystem::path& file_path)
{
	return shell_runner{}.run(command{std::vector<std::string>{"pdf2txt.py", file_path.string()}}).std_out;
}

std::string run_ocr(const std::filesystem::path& file_path, const extraction_options& options)
{
	scoped_temp_directory pages_dir;
	shell_runner{}.run(command{std::vector<std::string>{"pdftoppm", "-png", file_path.string(), (pages_dir.path() / "page").string()}});

	// pdftoppm zero-pads page numbers to the width of the last one, so names sort in page order
	std::vector<std::filesystem::path> pages;
	for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator(pages_dir.path()))
	{
		if (entry.path().extension() == ".png")
			pages.push_back(entry.path());
	}
	std::sort(pages.begin(), pages.end());
	throw_if(pages.empty(), file_path, errors::extraction_failed{});
	log_entry(file_path, pages.size());

	std::string text;
	for (const std::filesystem::path& page : pages)
		text += extraction::recognize_image(page, options);
	return text;
}

} // anonymous namespace

pdf_extractor::method pdf_extractor::parse_method(const std::string& name)
{
	if (name.empty())
		return method::pdftotext;
	std::optional<method> parsed = magic_enum::enum_cast<method>(name);
	if (!parsed)
		throw make_error("Unsupported extraction method", name, errors::extraction_failed{});
	return *parsed;
}

raw_content pdf_extractor::extract(const std::filesystem::path& file_path, const extraction_options& options) const
{
	method selected_method = parse_method(extraction::option_or(options, "method", ""));
	log_scope(file_path, selected_method);
	switch (selected_method)
	{
		case method::pdftotext:
			return byte_sequence{run_pdftotext(file_path, extraction::option_or(options, "layout", "false") == "true")};
		case method::pdfminer:
			return byte_sequence{run_pdfminer(file_path)};
		case method::tesseract:
			return byte_sequence{run_ocr(file_path, options)};
	}
	throw make_error("Unsupported extraction method", selected_method, errors::extraction_failed{});
}

} // namespace doctext
