#include <algorithm>
#include "doctext.h"
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    text_decoder decoder;

    bool invalid_sequence_reported = false;
    try
    {
      decoder.decode(byte_sequence{"abc \xC3\x28 def"}, "UTF-8");
    }
    catch (const std::exception& e)
    {
      ensure(errors::contains_type<errors::decoding_failed>(e)) == true;
      invalid_sequence_reported = true;
    }
    ensure(invalid_sequence_reported) == true;

    bool truncated_sequence_reported = false;
    try
    {
      decoder.decode(byte_sequence{"abc \xE2\x82"}, "UTF-8");
    }
    catch (const std::exception& e)
    {
      ensure(errors::contains_type<errors::decoding_failed>(e)) == true;
      truncated_sequence_reported = true;
    }
    ensure(truncated_sequence_reported) == true;

    // detected encoding that cannot decode the bytes: UTF-16LE byte order mark followed by half a code unit
    bool detected_encoding_failure_reported = false;
    try
    {
      decoder.decode(byte_sequence{"\xFF\xFE\x41"});
    }
    catch (const std::exception& e)
    {
      ensure(errors::contains_type<errors::decoding_failed>(e)) == true;
      ensure(errors::contains_type<errors::unsupported_encoding>(e)) == false;
      ensure(errors::diagnostic_message(e)).contains("Cannot decode bytes in detected encoding");
      ensure(errors::diagnostic_message(e)).contains("UTF-16LE");
      detected_encoding_failure_reported = true;
    }
    ensure(detected_encoding_failure_reported) == true;

    // empty input never reaches the detector
    {
      log::state_saver saver;
      std::vector<std::string> functions;
      log::set_sink([&functions](const log::record& rec) { functions.push_back(rec.m_location.function_name()); });
      log::set_filter("*");

      auto detector_calls = [&functions]
      {
        return std::count_if(functions.begin(), functions.end(),
          [](const std::string& f) { return f.find("charset_detector::detect") != std::string::npos; });
      };

      ensure(decoder.decode(byte_sequence{})) == unicode_string{};
      ensure(detector_calls()) == 0;
#ifndef NDEBUG
      decoder.decode(byte_sequence{"plain ASCII text"});
      ensure(detector_calls()) > 0;
#endif
    }

    bool unknown_encoding_reported = false;
    try
    {
      decoder.decode(byte_sequence{"abc"}, "NO-SUCH-ENCODING");
    }
    catch (const std::exception& e)
    {
      ensure(errors::contains_type<errors::unsupported_encoding>(e)) == true;
      ensure(errors::diagnostic_message(e)).contains("NO-SUCH-ENCODING");
      unknown_encoding_reported = true;
    }
    ensure(unknown_encoding_reported) == true;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
