#pragma once

#include "util/CppUtil.hpp"

#include <boost/dynamic_bitset.hpp>
#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace boost_util {

// Returns the indices of the set bits of the given bitset, in increasing order.
std::vector<int> get_set_indices(const boost::dynamic_bitset<>& bitset);

void pretty_print(std::ostream& os, boost::json::value const& jv, std::string* indent = nullptr);

namespace program_options {

struct Settings {
  static inline bool help_full = false;
};

/*
 * This class is a thin wrapper around boost::program_options::options_description. It aims to
 * provide a similar interface, with the added benefit that option-naming clashes are detected at
 * compile-time, rather than at runtime.
 *
 * Before:
 *
 * using namespace po = boost::program_options;
 * po::options_description desc("descr");
 * desc.add_options()
 *     ("rows,r", ...)
 *     ("columns", ...)
 *     ;
 * return desc;
 *
 * After:
 *
 * using namespace po2 = boost_util::program_options;
 * po2::options_description desc("descr");
 * return desc
 *     .add_option<"rows", 'r'>(...)
 *     .add_option<"columns">(...)
 *     ;
 */
template <typename StrSeq_ = util::StringLiteralSequence<>,
          util::concepts::IntSequence CharSeq_ = std::integer_sequence<int>>
class options_description {
 public:
  using StrSeq = StrSeq_;
  using CharSeq = CharSeq_;

  using base_t = boost::program_options::options_description;

  options_description(const char* name);
  ~options_description();

  /*
   * Similar to boost::program_options::options_description::add_options()(...), except that the
   * option name(s) is passed as a template argument, rather than as a function argument. This
   * allow for compile-time checking of name clashes.
   */
  template <util::StringLiteral StrLit, char Char = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  /*
   * Adds both --foo and --no-foo options. One of the two will be suppressed from the --help output,
   * depending on the value of *flag.
   *
   * Using --help-full instead of --help/-h will show both options.
   */
  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  auto add_flag(bool* flag, const char* true_help, const char* false_help);

  /*
   * Adds all options from desc to this.
   */
  template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
  auto add(const options_description<StrSeq2, CharSeq2>& desc);

  void print(std::ostream& s) const;

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    desc.print(s);
    return s;
  }

  const base_t& get() const { return *full_base_; }
  base_t& get() { return *full_base_; }

 private:
  options_description(base_t* full_base, base_t* base) : full_base_(full_base), base_(base) {}

  template <util::StringLiteral StrLit, char Char = ' '>
  auto augment() const;

  template <typename, util::concepts::IntSequence>
  friend class boost_util::program_options::options_description;

  base_t* full_base_;    // --help-full: both halves of every flag pair
  base_t* base_;         // --help: only the flag that changes the default
  std::string tmp_str_;  // hack for convenience in augment() usage
};

/*
 * Constructs a boost::program_options::command_line_parser out of ts, which is expected to be
 * a collection of strings from the command line. Uses this to store to the passed-in desc, which
 * should be a {boost, boost_util}::program_options::options_description. Returns the parsed
 * variables_map.
 *
 * Parse errors are rethrown as util::CleanException.
 */
template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
