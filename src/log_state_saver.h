/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_LOG_STATE_SAVER_H
#define DOCTEXT_LOG_STATE_SAVER_H

#include "log_core.h"

namespace doctext::log
{

/**
 * @brief Restores the sink and the filter active at construction time.
 */
class state_saver
{
public:
	state_saver()
		: m_old_sink(get_sink()), m_old_filter(get_filter())
	{}

	state_saver(const state_saver&) = delete;
	state_saver& operator=(const state_saver&) = delete;

	~state_saver()
	{
		set_sink(m_old_sink);
		set_filter(m_old_filter);
	}

private:
	std::function<void(const record&)> m_old_sink;
	std::string m_old_filter;
};

} // namespace doctext::log

#endif // DOCTEXT_LOG_STATE_SAVER_H
