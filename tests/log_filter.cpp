#include "doctext.h"
#include <iostream>
#include <sstream>

int main(int argc, char* argv[])
{
  using namespace doctext;

  try
  {
    log::state_saver saver;
    std::vector<serialization::array> records;
    log::set_sink([&records](const log::record& rec) { records.push_back(rec.m_context); });

    std::string file_name = "report.pdf";
    log::set_filter("audit");
    log_entry(log::audit{}, file_name);
    ensure(records.size()) == 1u;
    ensure(records[0].v.size()) == 2u;
    ensure(std::get<std::string>(std::get<serialization::object>(records[0].v[0]).v.at("tag"))) == "audit";
    ensure(std::get<std::string>(std::get<serialization::object>(records[0].v[1]).v.at("file_name"))) == file_name;

    log::set_filter("aud*,-@file:log_filter.cpp");
    log_entry(log::audit{}, file_name);
    ensure(records.size()) == 1u;

    log::set_filter("-audit *");
    log_entry(log::audit{}, file_name);
    ensure(records.size()) == 1u;

    log::set_filter("");
    log_entry(log::audit{}, file_name);
    ensure(records.size()) == 1u;

    log::set_filter("@func:*main*");
    log_entry(log::audit{}, "message");
    ensure(records.size()) == 2u;
    ensure(std::get<std::string>(records[1].v[1])) == "message";

    std::ostringstream json;
    log::set_sink(log::json_stream_sink(json));
    log::set_filter("*");
    log_entry(log::audit{}, file_name);
    log::set_sink(nullptr);
    ensure(json.str()).contains("\"file_name\":\"report.pdf\"");
    ensure(json.str()).contains("\"tag\":\"audit\"");
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }

  return 0;
}
