//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

// laurel: code political events from parsed news sentences
//
// stories are read from the sentence xml, coded in input order and written as tab separated event records.
//

#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include <algorithm>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/thread.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "laurel/config.hpp"
#include "laurel/dictionary.hpp"
#include "laurel/coder.hpp"
#include "laurel/record.hpp"

#include "utils/program_options.hpp"
#include "utils/compress_stream.hpp"
#include "utils/bounded_queue.hpp"

typedef boost::filesystem::path path_type;
typedef std::vector<path_type, std::allocator<path_type> > path_set_type;

typedef std::vector<laurel::StoryCoding, std::allocator<laurel::StoryCoding> > story_coding_set_type;

path_set_type input_files;
path_type     output_file = "-";

// dictionaries
std::string verbfile_name;
std::string actorfile_list;
std::string agentfile_name;
std::string discardfile_name;
std::string issuefile_name;
path_type   dictionary_dir;

// options
int  new_actor_length = 0;
bool require_dyad = true;
bool stop_on_error = false;
bool write_actor_root = false;
bool write_actor_text = false;
int  comma_min  = 2;
int  comma_max  = 8;
int  comma_bmin = 0;
int  comma_bmax = 0;
int  comma_emin = 0;
int  comma_emax = 0;
bool pause_by_sentence = false;
bool pause_by_story = false;

int threads = 1;

int debug = 0;

void options(int argc, char** argv);

path_type dictionary_path(const std::string& name)
{
  if (name.empty()) return path_type();

  const path_type path(name);

  return (dictionary_dir.empty() || path.is_absolute() ? path : dictionary_dir / path);
}

// wait for a line on the terminal. A non-empty line stops coding
bool pause_terminal()
{
  std::cerr << "press enter to continue, or any other input to stop: " << std::flush;

  std::string line;
  if (! std::getline(std::cin, line))
    return false;

  return boost::algorithm::trim_copy(line).empty();
}

struct PauseSentence
{
  bool operator()(const laurel::Coding& coding) const
  {
    std::cerr << "sentence: " << coding.id << " events: " << coding.events.size() << std::endl;
    return pause_terminal();
  }
};

struct TaskStory
{
  typedef utils::bounded_queue<size_t> queue_type;

  TaskStory(queue_type& __queue,
	    const laurel::Coder& __coder,
	    const laurel::story_set_type& __stories,
	    story_coding_set_type& __codings)
    : queue(__queue), coder(__coder), stories(__stories), codings(__codings), summary(), error() {}

  void operator()()
  {
    size_t id = 0;

    for (;;) {
      queue.pop(id);
      if (id == size_t(-1)) break;

      // keep draining the queue after an error so that the producer never blocks
      if (! error.empty()) continue;

      if (debug >= 2)
	std::cerr << "story: " << stories[id].id << std::endl;

      try {
	coder(stories[id], codings[id], summary);
      }
      catch (const std::exception& err) {
	error = err.what();
      }
    }
  }

  queue_type&                   queue;
  const laurel::Coder&          coder;
  const laurel::story_set_type& stories;
  story_coding_set_type&        codings;

  laurel::Summary summary;
  std::string     error;
};

void code_parallel(const laurel::Coder& coder,
		   const laurel::story_set_type& stories,
		   story_coding_set_type& codings,
		   laurel::Summary& summary)
{
  typedef TaskStory task_type;

  task_type::queue_type queue(threads * 8);

  boost::thread_group mapper;
  std::vector<task_type, std::allocator<task_type> > tasks(threads, task_type(queue, coder, stories, codings));

  for (int i = 0; i != threads; ++ i)
    mapper.add_thread(new boost::thread(boost::ref(tasks[i])));

  for (size_t id = 0; id != stories.size(); ++ id)
    queue.push(id);

  for (int i = 0; i != threads; ++ i)
    queue.push(size_t(-1));

  mapper.join_all();

  for (int i = 0; i != threads; ++ i) {
    if (! tasks[i].error.empty())
      throw std::runtime_error(tasks[i].error);

    summary += tasks[i].summary;
  }
}

// returns the number of stories coded
size_t code_sequential(const laurel::Coder& coder,
		       const laurel::story_set_type& stories,
		       story_coding_set_type& codings,
		       laurel::Summary& summary)
{
  for (size_t id = 0; id != stories.size(); ++ id) {
    if (debug >= 2)
      std::cerr << "story: " << stories[id].id << std::endl;

    bool proceeding = true;
    if (pause_by_sentence)
      proceeding = coder(stories[id], codings[id], summary, PauseSentence());
    else
      coder(stories[id], codings[id], summary);

    if (proceeding && pause_by_story) {
      std::cerr << "story: " << stories[id].id << " summary: " << summary << std::endl;
      proceeding = pause_terminal();
    }

    if (! proceeding)
      return id + 1;
  }

  return stories.size();
}

int main(int argc, char** argv)
{
  try {
    options(argc, argv);

    threads = std::max(1, threads);

    if (threads > 1 && (pause_by_sentence || pause_by_story)) {
      std::cerr << "warning: pause is disabled when coding with multiple threads" << std::endl;
      pause_by_sentence = false;
      pause_by_story = false;
    }

    laurel::Config config;
    config.comma_min        = comma_min;
    config.comma_max        = comma_max;
    config.comma_bmin       = comma_bmin;
    config.comma_bmax       = comma_bmax;
    config.comma_emin       = comma_emin;
    config.comma_emax       = comma_emax;
    config.require_dyad     = require_dyad;
    config.new_actor_length = new_actor_length;
    config.write_actor_root = write_actor_root;
    config.write_actor_text = write_actor_text;
    config.stop_on_error    = stop_on_error;
    config.debug            = debug;

    std::vector<std::string> actor_names;
    utils::comma_list(actorfile_list, actor_names);

    laurel::Dictionary::path_set_type actorfiles;
    for (size_t i = 0; i != actor_names.size(); ++ i)
      actorfiles.push_back(dictionary_path(actor_names[i]));

    laurel::Dictionary dict;
    dict.read(dictionary_path(verbfile_name),
	      actorfiles,
	      dictionary_path(agentfile_name),
	      dictionary_path(discardfile_name),
	      dictionary_path(issuefile_name));

    if (debug)
      std::cerr << "verbs: " << dict.verbs.size()
		<< " actors: " << dict.actors.phrases.size()
		<< " agents: " << dict.agents.phrases.size()
		<< std::endl;

    if (input_files.empty())
      input_files.push_back("-");

    laurel::story_set_type stories;
    laurel::SentenceReader reader(debug);

    path_set_type::const_iterator fiter_end = input_files.end();
    for (path_set_type::const_iterator fiter = input_files.begin(); fiter != fiter_end; ++ fiter) {
      if (fiter->string() != "-" && ! boost::filesystem::exists(*fiter))
	throw std::runtime_error("no input file: " + fiter->string());

      reader.read(*fiter, stories);
    }

    if (debug)
      std::cerr << "stories: " << stories.size() << std::endl;

    laurel::Coder coder(dict, config);
    laurel::Summary summary;

    story_coding_set_type codings(stories.size());
    size_t coded = stories.size();

    if (threads > 1)
      code_parallel(coder, stories, codings, summary);
    else
      coded = code_sequential(coder, stories, codings, summary);

    utils::compress_ostream os(output_file, 1024 * 1024);
    laurel::EventWriter writer(os, config, ! dict.issues.empty());

    for (size_t id = 0; id != coded; ++ id)
      writer(stories[id], codings[id]);

    std::cerr << summary << std::endl;
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

  // the names follow the sections of the config file
  po::options_description opts_config("configuration options");
  opts_config.add_options()
    ("Dictionaries.verbfile_name",    po::value<std::string>(&verbfile_name),    "verb dictionary")
    ("Dictionaries.actorfile_list",   po::value<std::string>(&actorfile_list),   "comma separated actor dictionaries")
    ("Dictionaries.agentfile_name",   po::value<std::string>(&agentfile_name),   "agent dictionary")
    ("Dictionaries.discardfile_name", po::value<std::string>(&discardfile_name), "discard list")
    ("Dictionaries.issuefile_name",   po::value<std::string>(&issuefile_name),   "issue list")
    ("Dictionaries.dictionary_dir",   po::value<path_type>(&dictionary_dir),     "directory for relative dictionary names")

    ("Options.new_actor_length", po::value<int>(&new_actor_length)->default_value(new_actor_length), "maximum words of an unresolved entity emitted as a new actor")
    ("Options.require_dyad",     utils::true_false_switch(&require_dyad),     "drop events with an unresolved participant")
    ("Options.stop_on_error",    utils::true_false_switch(&stop_on_error),    "stop at the first sentence failure")
    ("Options.write_actor_root", utils::true_false_switch(&write_actor_root), "write the root phrases of the participants")
    ("Options.write_actor_text", utils::true_false_switch(&write_actor_text), "write the matched text of the participants")

    ("Options.comma_min",  po::value<int>(&comma_min)->default_value(comma_min),   "minimum words of an internal comma clause")
    ("Options.comma_max",  po::value<int>(&comma_max)->default_value(comma_max),   "maximum words of an internal comma clause")
    ("Options.comma_bmin", po::value<int>(&comma_bmin)->default_value(comma_bmin), "minimum words of an initial comma clause")
    ("Options.comma_bmax", po::value<int>(&comma_bmax)->default_value(comma_bmax), "maximum words of an initial comma clause")
    ("Options.comma_emin", po::value<int>(&comma_emin)->default_value(comma_emin), "minimum words of a terminal comma clause")
    ("Options.comma_emax", po::value<int>(&comma_emax)->default_value(comma_emax), "maximum words of a terminal comma clause")

    ("Options.pause_by_sentence", utils::true_false_switch(&pause_by_sentence), "pause after each sentence")
    ("Options.pause_by_story",    utils::true_false_switch(&pause_by_story),    "pause after each story");

  po::options_description opts_command("command line options");
  opts_command.add_options()
    ("config",  po::value<path_type>(),                          "configuration file")
    ("input",   po::value<path_set_type>(&input_files)->multitoken(), "input sentence xml")
    ("output",  po::value<path_type>(&output_file)->default_value(output_file), "output events")
    ("threads", po::value<int>(&threads)->default_value(threads), "# of threads")

    ("debug", po::value<int>(&debug)->implicit_value(1), "debug level")
    ("help", "help message");

  po::options_description desc_config;
  po::options_description desc_command;

  desc_config.add(opts_config);
  desc_command.add(opts_config).add(opts_command);

  po::variables_map variables;

  po::store(po::parse_command_line(argc, argv, desc_command, po::command_line_style::unix_style & (~po::command_line_style::allow_guessing)), variables);
  if (variables.count("config")) {
    const path_type path_config = variables["config"].as<path_type>();
    if (! boost::filesystem::exists(path_config))
      throw std::runtime_error("no config file: " + path_config.string());

    // other sections of the file are not ours
    utils::compress_istream is(path_config);
    po::store(po::parse_config_file(is, desc_config, true), variables);
  }

  po::notify(variables);

  if (variables.count("help")) {
    std::cout << argv[0] << " [options]\n"
	      << desc_command << std::endl;
    exit(0);
  }
}
