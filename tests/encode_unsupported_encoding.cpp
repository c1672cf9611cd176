#include "doctext.h"
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    for (const unicode_string& text : {unicode_string{"plain text"}, unicode_string{}})
    {
      bool reported = false;
      try
      {
        text_encoder{}.encode(text, "klingon-8");
      }
      catch (const std::exception& e)
      {
        ensure(errors::contains_type<errors::unsupported_encoding>(e)) == true;
        ensure(errors::diagnostic_message(e)).contains("klingon-8");
        reported = true;
      }
      ensure(reported) == true;
    }

    ensure(charset_converter::is_supported("klingon-8")) == false;
    ensure(charset_converter::is_supported("utf-8")) == true;
    ensure(charset_converter::is_supported("windows-1250")) == true;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
