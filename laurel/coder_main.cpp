//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <sstream>
#include <stdexcept>

#include "coder.hpp"
#include "record.hpp"
#include "reader.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE coder_test

#include <boost/test/unit_test.hpp>

using namespace laurel;

static const char* attack = "(ROOT (S (NP (NNP FRANCE)) (VP (VBD ATTACKED) (NP (NNP GERMANY))) (. .)))";

struct Dictionaries
{
  Dictionaries()
  {
    std::istringstream is_verb("--- ATTACK [190]\n"
			       "ATTACK\n");
    std::istringstream is_actor("FRANCE_ [FRA]\n"
				"GERMANY_ [GMY]\n");
    std::istringstream is_agent("POLICE [~COP]\n");
    std::istringstream is_discard("+SOCCER\n"
				  "BASEBALL\n");
    
    Reader reader_verb(is_verb, "verbs");
    Reader reader_actor(is_actor, "actors");
    Reader reader_agent(is_agent, "agents");
    Reader reader_discard(is_discard, "discards");
    
    dict.verbs.read(reader_verb);
    dict.actors.read(reader_actor);
    dict.agents.read(reader_agent);
    dict.discards.read(reader_discard);
  }
  
  Dictionary dict;
};

Sentence sentence(const std::string& id, const std::string& text, const std::string& parse, const std::string& date = "20150101")
{
  Sentence sentence;
  sentence.id = id;
  sentence.date = date;
  sentence.source = "AFP";
  sentence.text = text;
  sentence.parse = parse;
  return sentence;
}

struct Stop
{
  bool operator()(const Coding&) const { return false; }
};

BOOST_AUTO_TEST_CASE(code_sentence)
{
  const Dictionaries dicts;
  const Coder coder(dicts.dict, Config());
  
  const Coding coding = coder(sentence("AFP0001-1", "FRANCE ATTACKED GERMANY.", attack));
  
  BOOST_CHECK(coding.failure.ok());
  BOOST_CHECK(coding.discard == DiscardList::NONE);
  BOOST_CHECK_EQUAL(coding.id, "AFP0001-1");
  BOOST_REQUIRE_EQUAL(coding.events.size(), size_t(1));
  BOOST_CHECK_EQUAL(coding.events.front().source.code, "FRA");
  BOOST_CHECK_EQUAL(coding.events.front().target.code, "GMY");
  BOOST_CHECK_EQUAL(coding.events.front().code, "190");
  BOOST_CHECK(coding.issues.empty());
  
  token_set_type tokens;
  BOOST_CHECK(coder.tokenize(sentence("AFP0001-1", "FRANCE ATTACKED GERMANY.", attack), tokens).ok());
  BOOST_REQUIRE(tokens.size() > 3);
  BOOST_CHECK(tokens[2].is_entity());
  BOOST_CHECK_EQUAL(tokens[2].code, "FRA");
}

BOOST_AUTO_TEST_CASE(code_failure)
{
  const Dictionaries dicts;
  const Coder coder(dicts.dict, Config());
  
  const Coding date = coder(sentence("AFP0001-1", "FRANCE ATTACKED GERMANY.", attack, "2015"));
  BOOST_CHECK(date.failure.tag() == Failure::BAD_DATE);
  BOOST_CHECK_EQUAL(std::string(date.failure.name()), "bad_date");
  BOOST_CHECK(date.events.empty());
  
  const Coding parse = coder(sentence("AFP0001-1", "FRANCE ATTACKED GERMANY.", "(ROOT (S (NP (NNP FRANCE))"));
  BOOST_CHECK(parse.failure.tag() == Failure::BAD_INPUT_PARSE);
  BOOST_CHECK(parse.events.empty());
  
  // discards are checked first
  const Coding discard = coder(sentence("AFP0001-1", "FRANCE PLAYED BASEBALL", attack, "2015"));
  BOOST_CHECK(discard.discard == DiscardList::SENTENCE);
  BOOST_CHECK(discard.failure.ok());
  BOOST_CHECK_EQUAL(discard.phrase, "BASEBALL");
}

BOOST_AUTO_TEST_CASE(code_story)
{
  const Dictionaries dicts;
  const Coder coder(dicts.dict, Config());
  
  Story story("AFP0001");
  story.sentences.push_back(sentence("AFP0001-1", "FRANCE ATTACKED GERMANY.", attack));
  story.sentences.push_back(sentence("AFP0001-2", "FRANCE PLAYED BASEBALL.", attack));
  story.sentences.push_back(sentence("AFP0001-3", "FRANCE ATTACKED GERMANY.", attack, "0000"));
  
  StoryCoding coding;
  Summary summary;
  
  coder(story, coding, summary);
  
  BOOST_CHECK_EQUAL(coding.id, "AFP0001");
  BOOST_CHECK(! coding.discarded);
  BOOST_REQUIRE_EQUAL(coding.codings.size(), size_t(3));
  BOOST_CHECK_EQUAL(coding.codings[0].events.size(), size_t(1));
  BOOST_CHECK(coding.codings[1].discard == DiscardList::SENTENCE);
  BOOST_CHECK(coding.codings[2].failure.tag() == Failure::BAD_DATE);
  
  BOOST_CHECK_EQUAL(summary.stories, size_t(1));
  BOOST_CHECK_EQUAL(summary.sentences, size_t(1));
  BOOST_CHECK_EQUAL(summary.events, size_t(1));
  BOOST_CHECK_EQUAL(summary.discards_sentence, size_t(1));
  BOOST_CHECK_EQUAL(summary.discards_story, size_t(0));
  BOOST_CHECK_EQUAL(summary.failures, size_t(1));
  
  Config config;
  config.stop_on_error = true;
  
  BOOST_CHECK_THROW(Coder(dicts.dict, config)(story, coding, summary), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(code_story_discard)
{
  const Dictionaries dicts;
  const Coder coder(dicts.dict, Config());
  
  // the story discard takes precedence over the sentence discard
  Story story("AFP0002");
  story.sentences.push_back(sentence("AFP0002-1", "FRANCE ATTACKED GERMANY.", attack));
  story.sentences.push_back(sentence("AFP0002-2", "THE SOCCER TEAM PLAYED BASEBALL.", attack));
  story.sentences.push_back(sentence("AFP0002-3", "FRANCE ATTACKED GERMANY.", attack));
  
  StoryCoding coding;
  Summary summary;
  
  coder(story, coding, summary);
  
  BOOST_CHECK(coding.discarded);
  BOOST_REQUIRE_EQUAL(coding.codings.size(), size_t(2));
  BOOST_CHECK(coding.codings[0].events.empty());
  BOOST_CHECK(coding.codings[1].discard == DiscardList::STORY);
  BOOST_CHECK_EQUAL(coding.codings[1].phrase, "SOCCER");
  
  BOOST_CHECK_EQUAL(summary.discards_story, size_t(1));
  BOOST_CHECK_EQUAL(summary.events, size_t(0));
  
  // nothing is written for a discarded story
  std::ostringstream os;
  EventWriter writer(os, Config(), false);
  writer(story, coding);
  BOOST_CHECK(os.str().empty());
}

BOOST_AUTO_TEST_CASE(code_story_stop)
{
  const Dictionaries dicts;
  const Coder coder(dicts.dict, Config());
  
  Story story("AFP0003");
  story.sentences.push_back(sentence("AFP0003-1", "FRANCE ATTACKED GERMANY.", attack));
  story.sentences.push_back(sentence("AFP0003-2", "FRANCE ATTACKED GERMANY.", attack));
  
  StoryCoding coding;
  Summary summary;
  
  BOOST_CHECK(! coder(story, coding, summary, Stop()));
  BOOST_CHECK_EQUAL(coding.codings.size(), size_t(1));
  BOOST_CHECK_EQUAL(summary.events, size_t(1));
}

BOOST_AUTO_TEST_CASE(record)
{
  BOOST_CHECK_EQUAL(story_id("AFP0001-1"), "AFP0001");
  BOOST_CHECK_EQUAL(story_id("AFP_ENG_0001_2"), "AFP_ENG_0001");
  BOOST_CHECK_EQUAL(story_id("AFP0001"), "AFP0001");
  
  std::istringstream is("<Sentences>\n"
			" <Sentence date=\"20150101\" id=\"AFP0001-1\" source=\"AFP\">\n"
			"  <Text>France attacked Germany.</Text>\n"
			"  <Parse>(ROOT (S (NP (NNP France)) (VP (VBD attacked) (NP (NNP Germany))) (. .)))</Parse>\n"
			" </Sentence>\n"
			" <Sentence date=\"20150101\" id=\"AFP0002-1\" source=\"AFP\">\n"
			"  <Text>No parse.</Text>\n"
			" </Sentence>\n"
			" <Sentence date=\"20150101\" id=\"AFP0001-2\" source=\"AFP\">\n"
			"  <Text>France attacked Germany again.</Text>\n"
			"  <Parse>(ROOT (S (NP (NNP France)) (VP (VBD attacked) (NP (NNP Germany))) (. .)))</Parse>\n"
			" </Sentence>\n"
			"</Sentences>\n");
  
  story_set_type stories;
  SentenceReader reader;
  reader.read(is, stories);
  
  BOOST_REQUIRE_EQUAL(stories.size(), size_t(1));
  BOOST_CHECK_EQUAL(stories.front().id, "AFP0001");
  BOOST_REQUIRE_EQUAL(stories.front().sentences.size(), size_t(2));
  BOOST_CHECK_EQUAL(stories.front().sentences[0].text, "FRANCE ATTACKED GERMANY.");
  BOOST_CHECK_EQUAL(stories.front().sentences[1].id, "AFP0001-2");
  
  const Dictionaries dicts;
  const Coder coder(dicts.dict, Config());
  
  StoryCoding coding;
  Summary summary;
  coder(stories.front(), coding, summary);
  
  std::ostringstream os;
  EventWriter writer(os, Config(), false);
  writer(stories.front(), coding);
  
  BOOST_CHECK_EQUAL(os.str(), "20150101\tFRA\tGMY\t190\tAFP0001-1;AFP0001-2\tAFP\n");
}
