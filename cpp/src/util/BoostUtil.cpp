#include "util/BoostUtil.hpp"

#include <sstream>

namespace boost_util {

namespace {

// Adapted from https://www.boost.org/doc/libs/1_76_0/libs/json/doc/html/json/examples.html
void pretty_print_helper(std::ostream& os, const boost::json::value& jv, std::string& indent,
                         int indent_width) {
  switch (jv.kind()) {
    case boost::json::kind::object: {
      const auto& obj = jv.get_object();
      if (obj.empty()) {
        os << "{}";
        break;
      }

      os << "{\n";
      indent.append(indent_width, ' ');
      for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (it != obj.begin()) os << ",\n";
        os << indent << boost::json::serialize(it->key()) << ": ";
        pretty_print_helper(os, it->value(), indent, indent_width);
      }
      indent.resize(indent.size() - indent_width);
      os << "\n" << indent << "}";
      break;
    }

    case boost::json::kind::array: {
      const auto& arr = jv.get_array();
      if (arr.empty()) {
        os << "[]";
        break;
      }

      bool is_simple_array = true;
      for (const auto& elem : arr) {
        if (elem.is_object() || elem.is_array()) is_simple_array = false;
      }

      // print without newlines if the array contains only simple elements
      if (is_simple_array) {
        os << "[";
        for (auto it = arr.begin(); it != arr.end(); ++it) {
          if (it != arr.begin()) os << ", ";
          pretty_print_helper(os, *it, indent, indent_width);
        }
        os << "]";
      } else {
        os << "[\n";
        indent.append(indent_width, ' ');
        for (auto it = arr.begin(); it != arr.end(); ++it) {
          if (it != arr.begin()) os << ",\n";
          os << indent;
          pretty_print_helper(os, *it, indent, indent_width);
        }
        indent.resize(indent.size() - indent_width);
        os << "\n" << indent << "]";
      }
      break;
    }

    case boost::json::kind::string:
      os << boost::json::serialize(jv.get_string());
      break;

    case boost::json::kind::uint64:
      os << jv.get_uint64();
      break;

    case boost::json::kind::int64:
      os << jv.get_int64();
      break;

    case boost::json::kind::double_: {
      auto x = jv.get_double();
      if (x == 0) {  // IEEE 754 standard is weird, 0 can be printed as -0
        os << "0";
      } else {
        os << x;
      }
      break;
    }

    case boost::json::kind::bool_:
      os << (jv.get_bool() ? "true" : "false");
      break;

    case boost::json::kind::null:
      os << "null";
      break;
  }
}

}  // namespace

void pretty_print(std::ostream& os, const boost::json::value& jv, int indent_width) {
  std::string indent;
  pretty_print_helper(os, jv, indent, indent_width);
}

std::string pretty_print(const boost::json::value& jv, int indent_width) {
  std::ostringstream ss;
  pretty_print(ss, jv, indent_width);
  return ss.str();
}

}  // namespace boost_util
