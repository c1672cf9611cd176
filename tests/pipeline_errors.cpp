#include "doctext.h"
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    bool missing_file_reported = false;
    try
    {
      process("/nonexistent/directory/report.txt", "UTF-8", {});
    }
    catch (const std::exception& e)
    {
      ensure(errors::contains_type<errors::extraction_failed>(e)) == true;
      ensure(errors::diagnostic_message(e)).contains("File not found");
      missing_file_reported = true;
    }
    ensure(missing_file_reported) == true;

    scoped_temp_file unknown{".xyz"};
    bool unknown_extension_reported = false;
    try
    {
      process(unknown.path(), "UTF-8", {});
    }
    catch (const std::exception& e)
    {
      ensure(errors::contains_type<errors::extraction_failed>(e)) == true;
      ensure(errors::diagnostic_message(e)).contains(".xyz");
      unknown_extension_reported = true;
    }
    ensure(unknown_extension_reported) == true;

    scoped_temp_file no_extension;
    bool no_extension_reported = false;
    try
    {
      process(no_extension.path(), "UTF-8", {});
    }
    catch (const std::exception& e)
    {
      ensure(errors::contains_type<errors::extraction_failed>(e)) == true;
      no_extension_reported = true;
    }
    ensure(no_extension_reported) == true;

    const extractor_registry& registry = extractor_registry::default_registry();
    for (const std::string extension : {".txt", ".pdf", ".png", ".jpg", ".jpeg", ".gif", ".tif", ".tiff", ".bmp", ".doc", ".ps", ".rtf"})
      ensure(registry.contains(extension)) == true;
    ensure(registry.contains("PDF")) == true;
    ensure(registry.contains(".docx")) == false;

    ensure(pdf_extractor::parse_method("") == pdf_extractor::method::pdftotext) == true;
    ensure(pdf_extractor::parse_method("pdfminer") == pdf_extractor::method::pdfminer) == true;
    ensure(pdf_extractor::parse_method("tesseract") == pdf_extractor::method::tesseract) == true;
    bool unknown_method_reported = false;
    try
    {
      pdf_extractor::parse_method("magic");
    }
    catch (const std::exception& e)
    {
      ensure(errors::contains_type<errors::extraction_failed>(e)) == true;
      unknown_method_reported = true;
    }
    ensure(unknown_method_reported) == true;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
