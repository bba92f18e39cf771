#pragma once

#include <map>
#include <string>
#include <utility>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <fr/utility/Text.hpp>

namespace fr::config {

namespace pt = boost::property_tree;

class Config {
public:
  using ParentType = pt::ptree;

  Config(const char *filename = nullptr) {
    if (filename) {
      pt::read_json(filename, root);
    }
  }

  explicit Config(pt::ptree tree) : root(std::move(tree)) {}

  bool hasChild(const std::string & child) const {
    return static_cast<bool>(root.get_child_optional(child));
  }

  template <typename Type>
  Type getConfig(const std::string & object, const std::string & attribute, const std::string & defval) const {
    if (auto value = root.get_optional<std::string>(pt::ptree::path_type(object + "." + attribute)); value) {
      return utility::fromString<Type>(*value);
    }
    return utility::fromString<Type>(defval);
  }

  void setAttribute(const std::string & object, const std::string & attribute, const std::string & val) {
    attributes_[object][attribute] = val;
  }

  template <typename Type>
  Type getAttribute(const std::string & object, const std::string & attribute,  const std::string & defval) const {
    if (auto oit = attributes_.find(object); oit != attributes_.end()) {
      if (auto ait = oit->second.find(attribute); ait != oit->second.end()) {
        return utility::fromString<Type>(ait->second);
      }
    }
    return utility::fromString<Type>(defval);
  }

  pt::ptree getChild (const std::string & child, pt::ptree parent = pt::ptree{}) const {
    if (parent.empty())
      return root.get_child(child);
    else
      return parent.get_child(child);
  }

  pt::ptree root;

private:
  std::map<std::string, std::map<std::string, std::string>> attributes_;
};

}
