#pragma once

#include <iostream>
#include <string>

#include <fr/config/Config.hpp>
#include <fr/utility/Format.hpp>

namespace fr::config {

inline void reportFatal(const std::string & appname, const std::string & errmsg) {
  std::cerr << frmt::format("{} fatal error '{}'", appname, errmsg) << std::endl;
}

struct Context {
  Context(const std::string name, const char *cfgfile = nullptr)
  : appname(name), config(cfgfile) { }

  const std::string appname;
  Config config;

  template <typename Type>
  Type getConfig(const std::string & object, const std::string & attribute, const std::string & defval) const {
    return config.getConfig<Type>(object, attribute, defval);
  }

  void setAttribute(const std::string & object, const std::string & attribute, const std::string & val) {
    config.setAttribute(object, attribute, val);
  }

  template <typename Type>
  Type getAttribute(const std::string & object, const std::string & attribute, const std::string & defval) const {
    return config.getAttribute<Type>(object, attribute, defval);
  }

  Config::ParentType getChild(const std::string & name) const {
    return config.getChild(name);
  }

  void report(const std::string & msg) const {
    std::cerr << frmt::format("{}: {}", appname, msg) << std::endl;
  }

  void fatal(const std::string & errmsg) const {
    reportFatal(appname, errmsg);
  }
};

}
