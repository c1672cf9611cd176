/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "charset_detector.h"

#include <algorithm>
#include <limits>
#include "log_entry.h"
#include "make_error.h"
#include <memory>
#include <unicode/ucsdet.h>

namespace doctext
{

namespace
{

struct detector_deleter
{
	void operator()(UCharsetDetector* detector) const { ucsdet_close(detector); }
};

using detector_ptr = std::unique_ptr<UCharsetDetector, detector_deleter>;

void check_status(UErrorCode status, const char* operation)
{
	if (U_FAILURE(status))
		throw make_error("ICU charset detection failed", std::string{operation}, std::string{u_errorName(status)});
}

} // anonymous namespace

std::optional<detection_result> charset_detector::detect(std::string_view bytes) const
{
	UErrorCode status = U_ZERO_ERROR;
	detector_ptr detector{ucsdet_open(&status)};
	check_status(status, "ucsdet_open");

	// ICU takes an int32_t length, longer input is clamped to what fits
	int32_t length = static_cast<int32_t>(std::min<size_t>(bytes.size(), std::numeric_limits<int32_t>::max()));
	ucsdet_setText(detector.get(), bytes.data(), length, &status);
	check_status(status, "ucsdet_setText");

	const UCharsetMatch* match = ucsdet_detect(detector.get(), &status);
	if (status == U_INVALID_CHAR_FOUND || match == nullptr)
	{
		log_entry("No encoding matches", bytes.size());
		return std::nullopt;
	}
	check_status(status, "ucsdet_detect");

	const char* name = ucsdet_getName(match, &status);
	check_status(status, "ucsdet_getName");
	int confidence = ucsdet_getConfidence(match, &status);
	check_status(status, "ucsdet_getConfidence");

	detection_result result{name, confidence};
	log_entry(result.encoding, result.confidence);
	return result;
}

} // namespace doctext
