//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

// laurel_validate: code the records of a validation file and compare with the expected codings
//
// <Validation>
//  <Environment>
//   <Verbfile name="verbs.txt"/> <Actorfile name="actors.txt"/> <Agentfile name="agents.txt"/>
//   <Discardfile name="discards.txt"/> <Issuefile name="issues.txt"/>
//   <Include categories="valid DEMO"/> <Exclude categories="SKIP"/> <Pause value="stop"/>
//  </Environment>
//  <Sentences>
//   <Config option="new_actor_length" value="4"/>
//   <Sentence id="DEMO-01" category="DEMO" valid="true" date="20150101">
//    <EventCoding sourcecode="FRA" targetcode="GMY" eventcode="190"/>
//    <Text>...</Text>
//    <Parse>...</Parse>
//   </Sentence>
//   <Stop/>
//  </Sentences>
// </Validation>
//

#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include <algorithm>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/tokenizer.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "laurel/config.hpp"
#include "laurel/dictionary.hpp"
#include "laurel/coder.hpp"
#include "laurel/record.hpp"

#include "utils/compress_stream.hpp"
#include "utils/unordered_set.hpp"

typedef boost::filesystem::path path_type;
typedef boost::property_tree::ptree ptree_type;

typedef std::vector<std::string, std::allocator<std::string> > code_set_type;
typedef utils::unordered_set<std::string>::type category_set_type;

path_type validation_file;

int debug = 0;

void options(int argc, char** argv);

// file name from the name attribute or the content of an element
std::string element_name(const ptree_type& node)
{
  const std::string name = node.get<std::string>("<xmlattr>.name", std::string());

  return boost::algorithm::trim_copy(name.empty() ? node.get_value<std::string>() : name);
}

path_type environment_path(const ptree_type& environment, const std::string& tag, const path_type& dir)
{
  boost::optional<const ptree_type&> node = environment.get_child_optional(tag);
  if (! node) return path_type();

  const std::string name = element_name(*node);
  if (name.empty()) return path_type();

  const path_type path(name);
  return (path.is_absolute() ? path : dir / path);
}

void categories(const ptree_type& environment, const std::string& tag, category_set_type& cats)
{
  typedef boost::char_separator<char> separator_type;
  typedef boost::tokenizer<separator_type> tokenizer_type;

  boost::optional<const ptree_type&> node = environment.get_child_optional(tag);
  if (! node) return;

  std::string list = node->get<std::string>("<xmlattr>.categories", std::string());
  if (list.empty())
    list = node->get_value<std::string>();

  tokenizer_type tokenizer(list, separator_type(" \t\n,"));
  cats.insert(tokenizer.begin(), tokenizer.end());
}

bool option_value(const std::string& value)
{
  const std::string lower = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));

  if (lower == "true" || lower == "yes" || lower == "1" || lower == "on")
    return true;
  else if (lower == "false" || lower == "no" || lower == "0" || lower == "off")
    return false;
  else
    throw std::runtime_error("invalid boolean: " + value);
}

void configure(laurel::Config& config, const std::string& option, const std::string& value)
{
  if (option == "new_actor_length")
    config.new_actor_length = boost::lexical_cast<int>(value);
  else if (option == "require_dyad")
    config.require_dyad = option_value(value);
  else if (option == "write_actor_root")
    config.write_actor_root = option_value(value);
  else if (option == "write_actor_text")
    config.write_actor_text = option_value(value);
  else if (option == "comma_min")
    config.comma_min = boost::lexical_cast<int>(value);
  else if (option == "comma_max")
    config.comma_max = boost::lexical_cast<int>(value);
  else if (option == "comma_bmin")
    config.comma_bmin = boost::lexical_cast<int>(value);
  else if (option == "comma_bmax")
    config.comma_bmax = boost::lexical_cast<int>(value);
  else if (option == "comma_emin")
    config.comma_emin = boost::lexical_cast<int>(value);
  else if (option == "comma_emax")
    config.comma_emax = boost::lexical_cast<int>(value);
  else
    std::cerr << "warning: unsupported option: " << option << std::endl;
}

struct Expected
{
  Expected() : events(), error(), noevents(false) {}

  code_set_type events;   // "source target code", sorted
  std::string   error;    // failure tag, sentencediscard or storydiscard
  bool          noevents;
};

Expected expected(const ptree_type& node)
{
  Expected result;

  ptree_type::const_iterator iter_end = node.end();
  for (ptree_type::const_iterator iter = node.begin(); iter != iter_end; ++ iter) {
    if (iter->first != "EventCoding") continue;

    const ptree_type& coding = iter->second;

    const std::string error = coding.get<std::string>("<xmlattr>.error", std::string());
    if (! error.empty()) {
      result.error = boost::algorithm::to_lower_copy(error);
      continue;
    }

    const std::string noevents = coding.get<std::string>("<xmlattr>.noevents", std::string());
    if (! noevents.empty()) {
      result.noevents = option_value(noevents);
      continue;
    }

    result.events.push_back(coding.get<std::string>("<xmlattr>.sourcecode", std::string()) + ' '
			    + coding.get<std::string>("<xmlattr>.targetcode", std::string()) + ' '
			    + coding.get<std::string>("<xmlattr>.eventcode", std::string()));
  }

  std::sort(result.events.begin(), result.events.end());

  return result;
}

code_set_type coded(const laurel::Coding& coding)
{
  code_set_type events;

  laurel::event_set_type::const_iterator eiter_end = coding.events.end();
  for (laurel::event_set_type::const_iterator eiter = coding.events.begin(); eiter != eiter_end; ++ eiter)
    events.push_back(eiter->source.code + ' ' + eiter->target.code + ' ' + eiter->code);

  std::sort(events.begin(), events.end());

  return events;
}

bool correct(const Expected& expect, const laurel::Coding& coding)
{
  if (! expect.error.empty()) {
    if (expect.error == "sentencediscard")
      return coding.discard == laurel::DiscardList::SENTENCE;
    else if (expect.error == "storydiscard")
      return coding.discard == laurel::DiscardList::STORY;
    else
      return expect.error == coding.failure.name();
  }

  if (coding.failure.failed() || coding.discard != laurel::DiscardList::NONE)
    return false;

  if (expect.noevents)
    return coding.events.empty();

  return expect.events == coded(coding);
}

std::ostream& operator<<(std::ostream& os, const code_set_type& events)
{
  if (events.empty())
    return os << "(none)";

  code_set_type::const_iterator eiter_end = events.end();
  for (code_set_type::const_iterator eiter = events.begin(); eiter != eiter_end; ++ eiter) {
    if (eiter != events.begin())
      os << " | ";
    os << *eiter;
  }
  return os;
}

int main(int argc, char** argv)
{
  try {
    options(argc, argv);

    if (validation_file.empty())
      throw std::runtime_error("no validation file");
    if (! boost::filesystem::exists(validation_file))
      throw std::runtime_error("no validation file: " + validation_file.string());

    ptree_type tree;
    {
      utils::compress_istream is(validation_file);
      boost::property_tree::read_xml(is, tree, boost::property_tree::xml_parser::trim_whitespace);
    }

    // the document element, if any, holds <Environment> and <Sentences>
    const ptree_type& document = (! tree.empty() && ! tree.get_child_optional("Environment") ? tree.front().second : tree);

    const ptree_type& environment = document.get_child("Environment");
    const path_type dir = validation_file.parent_path();

    laurel::Dictionary::path_set_type actorfiles;
    {
      ptree_type::const_iterator iter_end = environment.end();
      for (ptree_type::const_iterator iter = environment.begin(); iter != iter_end; ++ iter)
	if (iter->first == "Actorfile") {
	  const path_type path(element_name(iter->second));
	  actorfiles.push_back(path.is_absolute() ? path : dir / path);
	}
    }

    laurel::Dictionary dict;
    dict.read(environment_path(environment, "Verbfile", dir),
	      actorfiles,
	      environment_path(environment, "Agentfile", dir),
	      environment_path(environment, "Discardfile", dir),
	      environment_path(environment, "Issuefile", dir));

    category_set_type includes;
    category_set_type excludes;
    categories(environment, "Include", includes);
    categories(environment, "Exclude", excludes);

    const bool valid_only = includes.erase("valid");

    bool stop_at_mismatch = false;
    if (boost::optional<const ptree_type&> pause = environment.get_child_optional("Pause")) {
      std::string value = pause->get<std::string>("<xmlattr>.value", std::string());
      if (value.empty())
	value = pause->get_value<std::string>();
      stop_at_mismatch = (boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value)) == "stop");
    }

    laurel::Config config;
    laurel::SentenceReader reader(debug);

    size_t num_records = 0;
    size_t num_correct = 0;
    size_t num_skipped = 0;
    size_t num_failed = 0;

    const ptree_type& sentences = document.get_child("Sentences");

    ptree_type::const_iterator iter_end = sentences.end();
    for (ptree_type::const_iterator iter = sentences.begin(); iter != iter_end; ++ iter) {
      const ptree_type& node = iter->second;

      if (iter->first == "Stop") {
	if (debug)
	  std::cerr << "stop record" << std::endl;
	break;
      }

      if (iter->first == "Config") {
	configure(config,
		  node.get<std::string>("<xmlattr>.option"),
		  node.get<std::string>("<xmlattr>.value"));
	continue;
      }

      if (iter->first != "Sentence") continue;

      const std::string category = node.get<std::string>("<xmlattr>.category", std::string());
      const std::string valid    = node.get<std::string>("<xmlattr>.valid", std::string());

      if (valid_only && (valid.empty() || ! option_value(valid))) continue;
      if (! includes.empty() && includes.find(category) == includes.end()) continue;
      if (excludes.find(category) != excludes.end()) continue;

      ++ num_records;

      if (node.get_child_optional("Skip")) {
	++ num_skipped;
	continue;
      }

      laurel::Sentence sentence;
      const Expected expect = expected(node);

      bool passed = false;
      laurel::Coding coding;

      if (reader.sentence(node, sentence)) {
	const laurel::Coder coder(dict, config);

	coding = coder(sentence);
	passed = correct(expect, coding);
      } else
	coding.id = sentence.id;

      if (passed) {
	++ num_correct;

	if (debug)
	  std::cerr << "correct: " << sentence.id << std::endl;
	continue;
      }

      ++ num_failed;

      std::cout << "mismatch: " << coding.id << " category: " << category << '\n'
		<< "  expected: ";
      if (! expect.error.empty())
	std::cout << expect.error;
      else if (expect.noevents)
	std::cout << "(no events)";
      else
	std::cout << expect.events;
      std::cout << '\n'
		<< "  coded: " << coded(coding);
      if (coding.failure.failed())
	std::cout << " failure: " << coding.failure;
      if (coding.discard != laurel::DiscardList::NONE)
	std::cout << " discard: " << coding.phrase;
      std::cout << std::endl;

      if (stop_at_mismatch) break;
    }

    std::cout << "records: " << num_records
	      << " correct: " << num_correct
	      << " skipped: " << num_skipped
	      << " failed: " << num_failed
	      << std::endl;

    return (num_failed ? 1 : 0);
  }
  catch (const std::exception& err) {
    std::cerr << "error: " << err.what() << std::endl;
    return 1;
  }
  return 0;
}

void options(int argc, char** argv)
{
  namespace po = boost::program_options;

  po::options_description desc("options");
  desc.add_options()
    ("validation", po::value<path_type>(&validation_file), "validation file")

    ("debug", po::value<int>(&debug)->implicit_value(1), "debug level")

    ("help", "help message");

  po::positional_options_description pos;
  pos.add("validation", 1);

  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).style(po::command_line_style::unix_style & (~po::command_line_style::allow_guessing)).run(), vm);
  po::notify(vm);

  if (vm.count("help")) {
    std::cout << argv[0] << " [options] validation-file" << '\n' << desc << '\n';
    exit(0);
  }
}
