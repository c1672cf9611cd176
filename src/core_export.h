/*********************************************************************************************************************************************/
/*  doctext: text extraction from arbitrary document formats. Format-specific extractors feed a unicode-safe decode/encode pipeline          */
/*  built on iconv and ICU charset detection, with external tools (pdftotext, tesseract, antiword, ...) run through a deadlock-free          */
/*  subprocess runner.                                                                                                                       */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#ifndef DOCTEXT_CORE_EXPORT_H
#define DOCTEXT_CORE_EXPORT_H

#if defined(_WIN32)
	#ifdef DOCTEXT_CORE_EXPORTS
		#define DOCTEXT_CORE_EXPORT __declspec(dllexport)
	#else
		#define DOCTEXT_CORE_EXPORT __declspec(dllimport)
	#endif
#else
	#define DOCTEXT_CORE_EXPORT __attribute__((visibility("default")))
#endif

#endif // DOCTEXT_CORE_EXPORT_H
