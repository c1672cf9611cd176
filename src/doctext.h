/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_DOCTEXT_H
#define DOCTEXT_DOCTEXT_H

#include "charset_converter.h"
#include "charset_detector.h"
#include "command.h"
#include "contains_type.h"
#include "content.h"
#include "diagnostic_message.h"
#include "doc_extractor.h"
#include "ensure.h"
#include "environment.h"
#include "error_tags.h"
#include "extractor.h"
#include "extractor_registry.h"
#include "image_extractor.h"
#include "log_entry.h"
#include "log_json_stream_sink.h"
#include "log_scope.h"
#include "log_state_saver.h"
#include "make_error.h"
#include "pdf_extractor.h"
#include "pipeline.h"
#include "process_result.h"
#include "ps_extractor.h"
#include "rtf_extractor.h"
#include "scoped_temp.h"
#include "serialization_std.h"
#include "shell_runner.h"
#include "text_decoder.h"
#include "text_encoder.h"
#include "throw_if.h"
#include "txt_extractor.h"

#endif // DOCTEXT_DOCTEXT_H
