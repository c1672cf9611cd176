#include "doctext.h"
#include <iostream>

using namespace doctext;

namespace
{

struct recorded_call
{
  std::filesystem::path file_path;
  extraction_options options;
};

class recording_extractor : public extractor
{
public:
  recording_extractor(std::vector<recorded_call>& calls, raw_content result)
    : m_calls(calls), m_result(std::move(result))
  {}

  raw_content extract(const std::filesystem::path& file_path, const extraction_options& options) const override
  {
    m_calls.push_back({file_path, options});
    return m_result;
  }

private:
  std::vector<recorded_call>& m_calls;
  raw_content m_result;
};

class failing_extractor : public extractor
{
public:
  raw_content extract(const std::filesystem::path& file_path, const extraction_options& options) const override
  {
    shell_runner{}.run(command{"printf 'corrupt input' >&2; exit 2"});
    return byte_sequence{};
  }
};

}

int main(int argc, char* argv[])
{
  try
  {
    std::vector<recorded_call> calls;
    extractor_registry registry{{
      {".bin", [&calls] { return std::make_unique<recording_extractor>(calls, byte_sequence{"binary text"}); }},
      {"UNI", [&calls] { return std::make_unique<recording_extractor>(calls, unicode_string{"żółw"}); }},
      {".broken", [] { return std::make_unique<failing_extractor>(); }}
    }};
    pipeline custom_pipeline{registry};
    scoped_temp_file input{".bin"};

    // options reach the extractor unmodified, unknown keys included
    const extraction_options options{{"method", "fancy"}, {"language", "pol"}, {"unrecognized", "value"}};
    ensure(custom_pipeline.process(input.path(), "UTF-8", options).v) == "binary text";
    ensure(calls.size()) == 1u;
    ensure(calls[0].file_path) == input.path();
    ensure(calls[0].options) == options;

    // already decoded content skips detection and is encoded to the target
    const extraction_options uni{{"extension", "uni"}};
    ensure(custom_pipeline.process(input.path(), "UTF-16BE", uni).v) == std::string("\x01\x7C\x00\xF3\x01\x42\x00w", 8);
    ensure(calls.size()) == 2u;
    ensure(calls[1].options) == uni;

    // the extension option is honored even when the file name has no extractor
    scoped_temp_file unregistered{".unregistered"};
    ensure(custom_pipeline.process(unregistered.path(), "UTF-8", {{"extension", ".BIN"}}).v) == "binary text";

    // files known to the default registry are unknown to a custom one
    scoped_temp_file txt{".txt"};
    bool not_registered_reported = false;
    try
    {
      custom_pipeline.process(txt.path(), "UTF-8", {});
    }
    catch (const std::exception& e)
    {
      ensure(errors::contains_type<errors::extraction_failed>(e)) == true;
      not_registered_reported = true;
    }
    ensure(not_registered_reported) == true;

    // extractor errors surface unchanged
    scoped_temp_file broken{".broken"};
    bool extractor_error_reported = false;
    try
    {
      custom_pipeline.process(broken.path(), "UTF-8", {});
    }
    catch (const std::exception& e)
    {
      std::optional<errors::shell_failure> failure = errors::find_context<errors::shell_failure>(e);
      ensure(failure.has_value()) == true;
      ensure(failure->exit_code) == 2;
      ensure(failure->std_err) == "corrupt input";
      ensure(errors::contains_type<errors::decoding_failed>(e)) == false;
      extractor_error_reported = true;
    }
    ensure(extractor_error_reported) == true;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
