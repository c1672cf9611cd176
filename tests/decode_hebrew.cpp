#include "doctext.h"
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    // logical order Hebrew, reported by the detector as ISO-8859-8-I which iconv does not know
    const unicode_string hebrew{"שלום לכולם. זהו מסמך בעברית שנכתב כדי לבדוק את זיהוי הקידוד של קבצי טקסט ישנים. "
      "המערכת צריכה לזהות את הקידוד, להמיר את הטקסט ולהחזיר אותו בדיוק כפי שנכתב, בלי לאבד אף אות."};

    byte_sequence bytes = text_encoder{}.encode(hebrew, "ISO-8859-8");
    ensure(bytes.v.size()) < hebrew.v.size();

    std::optional<detection_result> detected = charset_detector{}.detect(bytes.v);
    ensure(detected.has_value()) == true;
    ensure(detected->encoding).contains("8859-8");

    ensure(text_decoder{}.decode(bytes)) == hebrew;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
