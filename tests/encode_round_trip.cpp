#include "doctext.h"
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    const unicode_string text{"Zażółć gęślą jaźń"};
    text_encoder encoder;
    text_decoder decoder;

    for (const std::string encoding : {"UTF-8", "ISO-8859-2", "windows-1250", "UTF-16LE", "UTF-32BE"})
    {
      byte_sequence bytes = encoder.encode(text, encoding);
      ensure(decoder.decode(bytes, encoding)) == text;
    }

    ensure(encoder.encode(text, "ISO-8859-2").v) == "Za\xBF\xF3\xB3\xE6 g\xEA\xB6l\xB1 ja\xBC\xF1";
    ensure(encoder.encode(text, "UTF-8").v) == text.v;
    ensure(encoder.encode(unicode_string{}, "ISO-8859-2")) == byte_sequence{};
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
