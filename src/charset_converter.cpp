/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "charset_converter.h"

#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <cerrno>
#include <cstring>
#include "error_tags.h"
#include <iconv.h>
#include "log_scope.h"
#include "make_error.h"
#include <mutex>
#include "serialization_std.h" // IWYU pragma: keep

namespace doctext
{

namespace
{

const iconv_t invalid_descriptor = reinterpret_cast<iconv_t>(-1);
const size_t iconv_failure = static_cast<size_t>(-1);

// glibc iconv_open is not thread-safe: it races on its cache of gconv modules.
std::mutex iconv_open_mutex;

iconv_t open_descriptor(const std::string& from, const std::string& to)
{
	std::lock_guard<std::mutex> lock(iconv_open_mutex);
	return iconv_open(to.c_str(), from.c_str());
}

bool is_utf8(const std::string& encoding)
{
	return boost::algorithm::iequals(encoding, "UTF-8") || boost::algorithm::iequals(encoding, "UTF8");
}

size_t utf8_sequence_length(unsigned char lead_byte)
{
	if (lead_byte < 0x80)
		return 1;
	if ((lead_byte & 0xE0) == 0xC0)
		return 2;
	if ((lead_byte & 0xF0) == 0xE0)
		return 3;
	if ((lead_byte & 0xF8) == 0xF0)
		return 4;
	return 1;
}

} // anonymous namespace

template<>
struct pimpl_impl<charset_converter> : pimpl_impl_base
{
	struct iconv_descriptor
	{
		iconv_t descriptor;

		iconv_descriptor(const std::string& from, const std::string& to)
			: descriptor(open_descriptor(from, to))
		{
			if (descriptor == invalid_descriptor)
			{
				int error_code = errno;
				if (error_code == EINVAL)
					throw make_error("Encoding not supported", from, to, errors::unsupported_encoding{});
				throw make_error("iconv_open() failed", std::string{std::strerror(error_code)}, from, to);
			}
		}

		~iconv_descriptor()
		{
			iconv_close(descriptor);
		}

		iconv_descriptor(const iconv_descriptor&) = delete;
		iconv_descriptor& operator=(const iconv_descriptor&) = delete;
	};

	pimpl_impl(const std::string& from, const std::string& to, charset_converter::invalid_sequence_policy policy)
		: m_from(from), m_to(to), m_policy(policy), m_utf8_source(is_utf8(from)), m_descriptor(from, to)
	{}

	size_t skip_length(const char* input, size_t bytes_left) const
	{
		size_t length = m_utf8_source ? utf8_sequence_length(static_cast<unsigned char>(*input)) : 1;
		return std::min(length, bytes_left);
	}

	std::string m_from;
	std::string m_to;
	charset_converter::invalid_sequence_policy m_policy;
	bool m_utf8_source;
	iconv_descriptor m_descriptor;
};

charset_converter::charset_converter(const std::string& from, const std::string& to, invalid_sequence_policy policy)
	: with_pimpl<charset_converter>(from, to, policy)
{
	log_scope(from, to, policy);
}

charset_converter::~charset_converter() = default;
charset_converter::charset_converter(charset_converter&&) noexcept = default;
charset_converter& charset_converter::operator=(charset_converter&&) noexcept = default;

std::string charset_converter::convert(std::string_view input) const
{
	if (input.empty())
		return "";

	const std::string& from = impl().m_from;
	const std::string& to = impl().m_to;

	// iconv is not const-correct for the input buffer
	char* inptr = const_cast<char*>(input.data());
	size_t inbytesleft = input.length();

	iconv_t descriptor = impl().m_descriptor.descriptor;
	iconv(descriptor, nullptr, nullptr, nullptr, nullptr);

	std::string output(input.length() * 2, '\0');
	size_t total_written = 0;
	size_t dropped_characters = 0;
	bool input_consumed = false;

	for (;;)
	{
		char* outptr = output.data() + total_written;
		size_t outbytesleft = output.size() - total_written;
		// after the input is consumed, a call without input writes the closing shift sequence of stateful encodings
		size_t result = input_consumed ?
			iconv(descriptor, nullptr, nullptr, &outptr, &outbytesleft) :
			iconv(descriptor, &inptr, &inbytesleft, &outptr, &outbytesleft);
		int error_code = errno;
		total_written = output.size() - outbytesleft;

		if (result != iconv_failure)
		{
			if (input_consumed)
				break;
			input_consumed = true;
		}
		else if (error_code == E2BIG)
			output.resize(output.size() * 2);
		else if (error_code == EILSEQ || error_code == EINVAL)
		{
			size_t offset = input.length() - inbytesleft;
			if (impl().m_policy == invalid_sequence_policy::fail)
				throw make_error("Invalid or incomplete byte sequence", from, to, offset, errors::decoding_failed{});
			size_t length = impl().skip_length(inptr, inbytesleft);
			inptr += length;
			inbytesleft -= length;
			++dropped_characters;
			input_consumed = (inbytesleft == 0);
		}
		else
			throw make_error("iconv() failed", std::string{std::strerror(error_code)}, from, to);
	}
	if (dropped_characters > 0)
		log_entry("Characters not representable in target encoding dropped", dropped_characters, to);
	output.resize(total_written);
	return output;
}

bool charset_converter::is_supported(const std::string& encoding)
{
	for (const auto& [from, to] : {std::pair{encoding, std::string{"UTF-8"}}, std::pair{std::string{"UTF-8"}, encoding}})
	{
		iconv_t descriptor = open_descriptor(from, to);
		if (descriptor == invalid_descriptor)
			return false;
		iconv_close(descriptor);
	}
	return true;
}

} // namespace doctext
