#include "doctext.h"
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    text_encoder encoder;
    const unicode_string text{"naïve café, 100 €"};

    ensure(encoder.encode(text, "ASCII").v) == "nave caf, 100 ";
    ensure(encoder.encode(text, "ISO-8859-1").v) == "na\xEFve caf\xE9, 100 ";
    ensure(encoder.encode(text, "ISO-8859-15").v) == "na\xEFve caf\xE9, 100 \xA4";
    ensure(encoder.encode(unicode_string{"日本語"}, "ASCII")) == byte_sequence{};
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
