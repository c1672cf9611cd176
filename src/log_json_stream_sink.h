/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_LOG_JSON_STREAM_SINK_H
#define DOCTEXT_LOG_JSON_STREAM_SINK_H

#include "core_export.h"
#include <functional>
#include "log_core.h"
#include <ostream>
#include "ref_or_owned.h"

namespace doctext::log
{

/**
 * @brief Creates a sink writing records to the stream as elements of one JSON array.
 *
 * The array is closed when the last copy of the returned function is destroyed.
 */
DOCTEXT_CORE_EXPORT std::function<void(const record&)> json_stream_sink(ref_or_owned<std::ostream> stream);

}

#endif // DOCTEXT_LOG_JSON_STREAM_SINK_H
