/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "log_json_stream_sink.h"

#include "json_serialization.h"
#include <memory>
#include <mutex>

namespace doctext::log
{

namespace
{

struct stream_state
{
	ref_or_owned<std::ostream> m_stream;
	bool m_first_log = true;
	std::mutex m_mutex;

	explicit stream_state(ref_or_owned<std::ostream> s) : m_stream(std::move(s)) {}

	~stream_state()
	{
		std::lock_guard lock(m_mutex);
		if (!m_first_log)
			m_stream.get() << std::endl << "]" << std::endl;
	}
};

} // anonymous namespace

std::function<void(const record&)> json_stream_sink(ref_or_owned<std::ostream> stream)
{
	auto state = std::make_shared<stream_state>(std::move(stream));

	return [state](const record& rec)
	{
		serialization::object log_record_object = create_base_metadata(rec.m_location);
		log_record_object.v["log"] = rec.m_context;
		std::string json_output = serialization::to_json(log_record_object);

		std::lock_guard lock(state->m_mutex);
		state->m_stream.get() << (state->m_first_log ? "[" : ",") << std::endl << json_output;
		state->m_first_log = false;
	};
}

} // namespace doctext::log
