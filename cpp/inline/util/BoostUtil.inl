#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"
#include "util/ScreenUtil.hpp"

#include <fmt/format.h>

#include <type_traits>
#include <utility>

namespace boost_util {

namespace program_options {

template <typename StrSeq, util::concepts::IntSequence CharSeq>
options_description<StrSeq, CharSeq>::options_description(const char* name)
    : full_base_(new base_t(name, util::get_screen_width() - 1)),
      base_(new base_t(name, util::get_screen_width() - 1)) {}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral Name, char Char, typename... Ts>
auto options_description<StrSeq, CharSeq>::add_option(Ts&&... ts) {
  auto out = extend<Name, Char>();
  std::string spec = option_spec(Name.value, Char);

  out.full_base_->add_options()(spec.c_str(), std::forward<Ts>(ts)...);
  out.base_->add_options()(spec.c_str(), std::forward<Ts>(ts)...);
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral TrueName, util::StringLiteral FalseName>
auto options_description<StrSeq, CharSeq>::add_flag(bool* flag, const char* true_help,
                                                    const char* false_help) {
  namespace po = boost::program_options;

  auto out = extend<TrueName>().template extend<FalseName>();

  std::string true_text = true_help;
  std::string false_text = false_help;
  (*flag ? true_text : false_text) += " (no-op)";

  auto add_true = [&](base_t* base) {
    base->add_options()(TrueName.value, po::value(flag)->implicit_value(true)->zero_tokens(),
                        true_text.c_str());
  };
  auto add_false = [&](base_t* base) {
    base->add_options()(FalseName.value, po::value(flag)->implicit_value(false)->zero_tokens(),
                        false_text.c_str());
  };

  add_true(out.full_base_);
  add_false(out.full_base_);
  if (*flag) {
    add_false(out.base_);
  } else {
    add_true(out.base_);
  }
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
auto options_description<StrSeq, CharSeq>::add(const options_description<StrSeq2, CharSeq2>& desc) {
  static_assert(util::no_overlap_v<StrSeq, StrSeq2>, "Options name clash!");
  static_assert(util::no_overlap_v<CharSeq, CharSeq2>, "Options abbreviation clash!");

  full_base_->add(*desc.full_base_);
  base_->add(*desc.base_);

  using OutT = options_description<util::concat_string_literal_sequence_t<StrSeq, StrSeq2>,
                                   util::concat_int_sequence_t<CharSeq, CharSeq2>>;
  return OutT(full_base_, base_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
void options_description<StrSeq, CharSeq>::print(std::ostream& os) const {
  (Settings::help_full ? full_base_ : base_)->print(os);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral Name, char Char>
auto options_description<StrSeq, CharSeq>::extend() const {
  constexpr bool kHasAbbrev = Char != ' ';
  static_assert(!util::string_literal_sequence_contains_v<StrSeq, Name>, "Options name clash!");
  static_assert(!kHasAbbrev || !util::int_sequence_contains_v<CharSeq, int(Char)>,
                "Options abbreviation clash!");

  using StrSeq2 = util::concat_string_literal_sequence_t<StrSeq, util::StringLiteralSequence<Name>>;
  using CharSeq2 = std::conditional_t<
    kHasAbbrev, util::concat_int_sequence_t<CharSeq, util::int_sequence<int(Char)>>, CharSeq>;
  return options_description<StrSeq2, CharSeq2>(full_base_, base_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
std::string options_description<StrSeq, CharSeq>::option_spec(const char* name, char abbrev) {
  if (abbrev == ' ') return name;
  return fmt::format("{},{}", name, abbrev);
}

template <typename Desc, typename... Ts>
boost::program_options::variables_map parse_args(const Desc& desc, Ts&&... ts) {
  namespace po = boost::program_options;

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(std::forward<Ts>(ts)...).options(desc.get()).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace program_options

}  // namespace boost_util
