#include "doctext.h"
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    text_decoder decoder;
    // already decoded text is never inspected, even if it is not something a detector would accept
    unicode_string text{"Zażółć gęślą jaźń \xEF\xBB\xBF"};
    ensure(decoder.decode(text)) == text;
    ensure(decoder.decode(decoder.decode(text))) == text;
    ensure(decoder.decode(text, "ISO-8859-2")) == text;

    ensure(decoder.decode(byte_sequence{})) == unicode_string{};
    ensure(decoder.decode(byte_sequence{}, "UTF-16LE")) == unicode_string{};
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
