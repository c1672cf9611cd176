#include "doctext.h"
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    const std::string polish = "Zażółć gęślą jaźń. Pchnąć w tę łódź jeża lub ośm skrzyń fig. Źdźbło trawy.";

    text_decoder decoder;
    ensure(decoder.decode(byte_sequence{polish}).v) == polish;

    // byte order mark is removed from the decoded text
    ensure(decoder.decode(byte_sequence{"\xEF\xBB\xBF" + polish}).v) == polish;

    std::optional<detection_result> detected = charset_detector{}.detect(polish);
    ensure(detected.has_value()) == true;
    ensure(detected->encoding) == "UTF-8";
    ensure(detected->confidence) > 0;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
