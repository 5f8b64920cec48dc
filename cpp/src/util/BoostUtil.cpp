#include "util/BoostUtil.hpp"

// Boost.JSON is used header-only; its implementation is compiled into this translation unit
#include <boost/json/src.hpp>

#include <algorithm>

namespace boost_util {

std::vector<int> get_set_indices(const boost::dynamic_bitset<>& bitset) {
  std::vector<int> indices;
  indices.reserve(bitset.count());

  for (auto index = bitset.find_first(); index != boost::dynamic_bitset<>::npos;
       index = bitset.find_next(index)) {
    indices.push_back(index);
  }
  return indices;
}

// The code below was adapted from:
// https://www.boost.org/doc/libs/1_76_0/libs/json/doc/html/json/examples.html
void pretty_print(std::ostream& os, boost::json::value const& jv, std::string* indent) {
  std::string indent_;
  if (!indent) indent = &indent_;
  switch (jv.kind()) {
    case boost::json::kind::object: {
      os << "{\n";
      indent->append(2, ' ');
      auto const& obj = jv.get_object();

      if (!obj.empty()) {
        // Collect iterators, sort by key
        std::vector<boost::json::object::const_iterator> its;
        its.reserve(obj.size());
        for (auto it = obj.begin(); it != obj.end(); ++it) its.push_back(it);

        std::sort(its.begin(), its.end(), [](auto a, auto b) { return a->key() < b->key(); });

        for (std::size_t i = 0; i < its.size(); ++i) {
          auto it = its[i];
          os << *indent << boost::json::serialize(it->key()) << " : ";
          pretty_print(os, it->value(), indent);
          if (i + 1 != its.size()) os << ",\n";
        }
      }

      os << "\n";
      indent->resize(indent->size() - 2);
      os << *indent << "}";
      break;
    }

    case boost::json::kind::array: {
      auto const& arr = jv.get_array();
      if (arr.empty()) {
        os << "[]";
        break;
      }

      auto it = arr.begin();
      bool is_simple_array =
        (it->kind() != boost::json::kind::object) && (it->kind() != boost::json::kind::array);

      // print without newlines if the array contains only simple elements
      if (is_simple_array) {
        os << "[";

        while (true) {
          pretty_print(os, *it, indent);
          if (++it == arr.end()) break;
          os << ", ";
        }
        os << "]";
      } else {
        os << "[\n";
        indent->append(2, ' ');

        while (true) {
          os << *indent;
          pretty_print(os, *it, indent);
          if (++it == arr.end()) break;
          os << ",\n";
        }
        os << "\n";
        indent->resize(indent->size() - 2);
        os << *indent << "]";
      }
      break;
    }

    case boost::json::kind::string: {
      os << boost::json::serialize(jv.get_string());
      break;
    }

    case boost::json::kind::uint64:
      os << jv.get_uint64();
      break;

    case boost::json::kind::int64:
      os << jv.get_int64();
      break;

    case boost::json::kind::double_:
      os << jv.get_double();
      break;

    case boost::json::kind::bool_:
      os << (jv.get_bool() ? "true" : "false");
      break;

    case boost::json::kind::null:
      os << "null";
      break;
  }
}

}  // namespace boost_util
