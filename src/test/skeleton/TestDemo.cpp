#include <boost/test/unit_test.hpp>
#include <skeleton/Demo.hpp>

#include <cstdio>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace fr::skeleton;

namespace {

struct TempJson {
  explicit TempJson(const std::string & content)
    : path((std::filesystem::temp_directory_path() / ("fieldreg-demo-" + std::to_string(::getpid()) + ".json")).string())
  {
    std::ofstream out(path);
    out << content;
  }

  ~TempJson() {
    std::remove(path.c_str());
  }

  std::string path;
};

struct CapturedErrors {
  CapturedErrors() : saved(std::cerr.rdbuf(text.rdbuf())) {}
  ~CapturedErrors() { std::cerr.rdbuf(saved); }

  std::ostringstream text;
  std::streambuf * saved;
};

}

BOOST_AUTO_TEST_SUITE(DemoTestSuite)

BOOST_AUTO_TEST_CASE(test_builtin_types) {
  std::ostringstream out;
  BOOST_CHECK_EQUAL(runDemo(nullptr, out), 0);
  BOOST_CHECK(out.str().find("Order") != std::string::npos);
  BOOST_CHECK(out.str().find("explicit") != std::string::npos);
  BOOST_CHECK(out.str().find("implicit") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_configured_types) {
  TempJson file(R"({"types": [{"name": "Account", "fields": [
    {"name": "price", "type": "double", "modifiers": "private"},
    {"name": "note", "type": "String"}]}]})");
  std::ostringstream out;
  BOOST_CHECK_EQUAL(runDemo(file.path.c_str(), out), 0);
  BOOST_CHECK(out.str().find("Account") != std::string::npos);
  BOOST_CHECK(out.str().find("m_price") != std::string::npos);
  BOOST_CHECK(out.str().find("@Money") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_missing_config_file) {
  const std::string path = (std::filesystem::temp_directory_path() / "fieldreg-demo-absent.json").string();
  std::remove(path.c_str());
  CapturedErrors errors;
  std::ostringstream out;
  BOOST_CHECK_EQUAL(runDemo(path.c_str(), out), 1);
  BOOST_CHECK(out.str().empty());
  BOOST_CHECK(errors.text.str().find("fieldreg-demo fatal error") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_malformed_config_file) {
  TempJson file(R"({"types": [)");
  CapturedErrors errors;
  std::ostringstream out;
  BOOST_CHECK_EQUAL(runDemo(file.path.c_str(), out), 1);
  BOOST_CHECK(errors.text.str().find("fieldreg-demo fatal error") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_unknown_modifier) {
  TempJson file(R"({"types": [{"name": "Account", "fields": [{"name": "id", "type": "long", "modifiers": "private sealed"}]}]})");
  CapturedErrors errors;
  std::ostringstream out;
  BOOST_CHECK_EQUAL(runDemo(file.path.c_str(), out), 1);
  BOOST_CHECK(errors.text.str().find("Unknown field modifier 'sealed'") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
