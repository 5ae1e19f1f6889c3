#pragma once

#include "util/CppUtil.hpp"

#include <boost/program_options.hpp>

#include <ostream>
#include <string>

namespace boost_util {

namespace program_options {

struct Settings {
  // Set from --help-full. Makes options_description::print() include the no-op flag variants.
  static inline bool help_full = false;
};

/*
 * Wrapper around boost::program_options::options_description that records every option name and
 * one-letter abbreviation in its type, so that two option groups defining the same name fail to
 * compile when they are combined with add().
 *
 * namespace po = boost::program_options;
 * namespace po2 = boost_util::program_options;
 *
 * po2::options_description desc("Play options");
 * return desc
 *     .add_option<"board-size", 's'>(po::value<int>(&board_size), "board size")
 *     .add_flag<"omit-timestamps", "include-timestamps">(&omit, "omit", "include");
 *
 * Every add_*() call returns a new object of a new type, so calls have to be chained as above.
 */
template <typename StrSeq_ = util::StringLiteralSequence<>,
          util::concepts::IntSequence CharSeq_ = util::int_sequence<>>
class options_description {
 public:
  using StrSeq = StrSeq_;
  using CharSeq = CharSeq_;
  using base_t = boost::program_options::options_description;

  explicit options_description(const char* name);

  // add_options()("name,c", ts...) with the name and the optional abbreviation checked at compile
  // time. Char == ' ' means no abbreviation.
  template <util::StringLiteral Name, char Char = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  /*
   * Adds the pair --TrueName / --FalseName, which set *flag to true / false. Plain --help only
   * shows the one that changes the current value of *flag.
   */
  template <util::StringLiteral TrueName, util::StringLiteral FalseName>
  auto add_flag(bool* flag, const char* true_help, const char* false_help);

  // Merges another group into this one.
  template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
  auto add(const options_description<StrSeq2, CharSeq2>& desc);

  void print(std::ostream& os) const;

  friend std::ostream& operator<<(std::ostream& os, const options_description& desc) {
    desc.print(os);
    return os;
  }

  const base_t& get() const { return *full_base_; }

 private:
  template <typename, util::concepts::IntSequence>
  friend class boost_util::program_options::options_description;

  options_description(base_t* full_base, base_t* base) : full_base_(full_base), base_(base) {}

  // Returns a copy of *this whose type also records Name (and Char).
  template <util::StringLiteral Name, char Char = ' '>
  auto extend() const;

  static std::string option_spec(const char* name, char abbrev);

  // boost keeps raw pointers into the base_t objects, and every add_*() call returns a new wrapper
  // sharing them, so they are never freed.
  base_t* full_base_;  // every option
  base_t* base_;       // without the no-op flag variants
};

/*
 * Parses the command line (argc, argv) into a variables_map and runs the notifiers, which writes
 * the values into the variables bound with po::value(&x). Parse errors are rethrown as
 * util::CleanException.
 */
template <typename Desc, typename... Ts>
boost::program_options::variables_map parse_args(const Desc& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
