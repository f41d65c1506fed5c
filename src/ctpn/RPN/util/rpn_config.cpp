#include <cstdlib>
#include <fstream>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/foreach.hpp>

#include "ctpn/RPN/util/rpn_utils.hpp"

namespace ctpn {

namespace Rpn {

str_map parse_json_config(const std::string file_path) {
  std::ifstream ifs(file_path.c_str());
  CHECK(ifs.is_open()) << "Can not open config file : " << file_path;
  std::map<std::string, std::string> json_map;
  boost::property_tree::ptree pt;
  try {
    boost::property_tree::read_json(ifs, pt);
  } catch (const boost::property_tree::json_parser_error& e) {
    LOG(FATAL) << "Illegal config file " << file_path << " : " << e.what();
  }

  BOOST_FOREACH(const boost::property_tree::ptree::value_type& item, pt) {
    if (item.second.empty()) {
      json_map[item.first] = item.second.data();
    } else {
      // a json array, flattened to the comma separated form
      std::vector<std::string> elems;
      BOOST_FOREACH(const boost::property_tree::ptree::value_type& elem, item.second) {
        elems.push_back(elem.second.data());
      }
      json_map[item.first] = boost::algorithm::join(elems, ",");
    }
  }
  return json_map;
}

std::string extract_string(std::string target_key,
    str_map& default_map) {
  std::string target_str;
  if (default_map.count(target_key) > 0) {
    target_str = default_map[target_key];
  } else {
    LOG(FATAL) << "Can not find target_key : " << target_key;
  }
  return target_str;
}

std::string extract_string(std::string target_key, const std::string& default_value,
    str_map& default_map) {
  if (default_map.count(target_key) == 0) {
    DLOG(INFO) << "Use default value for " << target_key << " : " << default_value;
    return default_value;
  }
  return extract_string(target_key, default_map);
}

float extract_float(std::string target_key,
    str_map& default_map) {
  std::string target_str = extract_string(target_key, default_map);
  return atof(target_str.c_str());
}

float extract_float(std::string target_key, float default_value,
    str_map& default_map) {
  if (default_map.count(target_key) == 0) return default_value;
  return extract_float(target_key, default_map);
}

int extract_int(std::string target_key,
    str_map& default_map) {
  std::string target_str = extract_string(target_key, default_map);
  return atoi(target_str.c_str());
}

int extract_int(std::string target_key, int default_value,
    str_map& default_map) {
  if (default_map.count(target_key) == 0) return default_value;
  return extract_int(target_key, default_map);
}

std::vector<float> extract_vector(std::string target_key,
     str_map& default_map) {
  std::string target_str = extract_string(target_key, default_map);
  std::vector<float> results;
  std::vector<std::string> elems;
  boost::algorithm::split(elems, target_str, boost::algorithm::is_any_of(","));

  for (std::vector<std::string>::iterator it = elems.begin();
       it != elems.end(); ++it) {
    boost::algorithm::trim(*it);
    if (it->empty()) continue;
    results.push_back(atof(it->c_str()));
  }
  return results;
}

std::vector<float> extract_vector(std::string target_key, const std::vector<float>& default_value,
     str_map& default_map) {
  if (default_map.count(target_key) == 0) return default_value;
  return extract_vector(target_key, default_map);
}

} // namespace Rpn

} // namespace ctpn
