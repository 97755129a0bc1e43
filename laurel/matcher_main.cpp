//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <sstream>
#include <cctype>
#include <cstdlib>

#include <boost/tokenizer.hpp>

#include "matcher.hpp"
#include "verb.hpp"
#include "reader.hpp"
#include "token.hpp"

#include "utils/space_separator.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE matcher_test

#include <boost/test/unit_test.hpp>

using namespace laurel;

static const char* verbs = 
  "--- ATTACK [190]\n"
  "ATTACK\n"
  "--- MEET [040]\n"
  "MEET {MEETS MET MEETING}\n"
  "+MET_WITH [041]\n"
  "--- WARN [130]\n"
  "WARN\n"
  "- * AGAINST + [138]\n"
  "--- CARRY [---]\n"
  "CARRY\n"
  "+CARRY_OUT [050]\n"
  "+CARRY_OUT_ATTACK [190]\n"
  "--- FIGHT [190]\n"
  "FIGHT {FIGHTS FOUGHT FIGHTING}\n"
  "&WEAPON\n"
  "+GUN\n"
  "+ROCKET_LAUNCHER\n"
  "- * WITH &WEAPON [195]\n"
  "- * ^ WITH + [196]\n"
  "--- PRAISE [051]\n"
  "PRAISE\n"
  "- + * BY $ [052]\n"
  "--- ACCUSE [112]\n"
  "ACCUSE\n"
  "- * OF_ATTACKING [1121]\n"
  "--- NEGOTIATE [046]\n"
  "NEGOTIATE\n"
  "- * BETWEEN % [0461]\n";

// tokens from their printed form
token_set_type tokenize(const std::string& line)
{
  typedef boost::tokenizer<utils::space_separator> tokenizer_type;
  
  token_set_type tokens;
  
  tokenizer_type tokenizer(line);
  for (tokenizer_type::iterator iter = tokenizer.begin(); iter != tokenizer.end(); ++ iter) {
    const std::string& word = *iter;
    
    if (word.size() < 2 || (word[0] != '(' && word[0] != '~')) {
      tokens.push_back(Token::word(word));
      continue;
    }
    
    std::string label = word.substr(1);
    int index = 0;
    
    std::string::size_type pos = label.size();
    while (pos > 1 && std::isdigit(label[pos - 1]))
      -- pos;
    if (pos != label.size()) {
      index = std::atoi(label.substr(pos).c_str());
      label.erase(pos);
    }
    
    if (label == "NE")
      tokens.push_back(word[0] == '(' ? Token::entity() : Token::entity_end());
    else if (label == "NEC")
      tokens.push_back(word[0] == '(' ? Token::compound(index) : Token::compound_end(index));
    else
      tokens.push_back(word[0] == '(' ? Token::open(label, index) : Token::close(label, index));
  }
  
  return tokens;
}

void resolve(token_set_type& tokens, const size_t pos, const std::string& code)
{
  BOOST_REQUIRE(pos < tokens.size());
  BOOST_REQUIRE(tokens[pos].is_entity());
  
  tokens[pos].code = code;
  tokens[pos].text = tokens[pos + 1].label;
}

struct Verbs
{
  Verbs()
  {
    std::istringstream is(verbs);
    Reader reader(is, "verbs");
    
    dict.read(reader);
  }
  
  VerbDictionary dict;
};

BOOST_AUTO_TEST_CASE(sequence)
{
  const token_set_type tokens = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD ATTACKED ~VBD (NE GERMANY ~NE ~VP1 (. . ~. ~S ~ROOT");
  
  sequence_type upper;
  Matcher::upper_sequence(tokens, 6, upper);
  
  BOOST_REQUIRE_EQUAL(upper.size(), size_t(3));
  BOOST_CHECK(upper[0].kind == Token::ENTITY_END);
  BOOST_CHECK_EQUAL(upper[1].word, "FRANCE");
  BOOST_CHECK(upper[2].kind == Token::ENTITY);
  BOOST_CHECK_EQUAL(upper[2].position, size_t(2));
  
  sequence_type lower;
  BOOST_CHECK(Matcher::lower_sequence(tokens, 8, 12, lower));
  BOOST_REQUIRE_EQUAL(lower.size(), size_t(3));
  BOOST_CHECK(lower[0].kind == Token::ENTITY);
  BOOST_CHECK_EQUAL(lower[0].position, size_t(9));
  BOOST_CHECK_EQUAL(lower[1].word, "GERMANY");
  
  // past the end of the tokens
  BOOST_CHECK(! Matcher::lower_sequence(tokens, 8, tokens.size() + 1, lower));
  
  // the upper context stops at a comma
  const token_set_type comma = tokenize("(ROOT (S (NE FRANCE ~NE (, , ~, (NE GERMANY ~NE (VP1 (VBD ATTACKED ~VBD ~VP1 ~S ~ROOT");
  
  Matcher::upper_sequence(comma, 12, upper);
  BOOST_REQUIRE_EQUAL(upper.size(), size_t(3));
  BOOST_CHECK_EQUAL(upper[1].word, "GERMANY");
}

BOOST_AUTO_TEST_CASE(passive)
{
  const token_set_type active = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD ATTACKED ~VBD (NE GERMANY ~NE ~VP1 ~S ~ROOT");
  BOOST_CHECK_EQUAL(Matcher::passive(active, 5, 12), size_t(0));
  
  const token_set_type tokens = tokenize("(ROOT (S (NE GERMANY ~NE (VP1 (VBD WAS ~VBD (VP2 (VBN ATTACKED ~VBN (PP (IN BY ~IN (NE FRANCE ~NE ~PP ~VP2 ~VP1 ~S ~ROOT");
  BOOST_CHECK_EQUAL(Matcher::passive(tokens, 5, 22), size_t(11));
  
  // no agent
  const token_set_type agentless = tokenize("(ROOT (S (NE GERMANY ~NE (VP1 (VBD WAS ~VBD (VP2 (VBN ATTACKED ~VBN ~VP2 ~VP1 ~S ~ROOT");
  BOOST_CHECK_EQUAL(Matcher::passive(agentless, 5, 14), size_t(0));
}

BOOST_AUTO_TEST_CASE(event)
{
  const Verbs verbs;
  const Matcher matcher(verbs.dict, Config());
  
  token_set_type tokens = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD ATTACKED ~VBD (NE GERMANY ~NE ~VP1 (. . ~. ~S ~ROOT");
  resolve(tokens, 2, "FRA");
  resolve(tokens, 9, "GMY");
  
  event_set_type events;
  const Failure failure = matcher(tokens, events);
  
  BOOST_CHECK(failure.ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().source.code, "FRA");
  BOOST_CHECK_EQUAL(events.front().target.code, "GMY");
  BOOST_CHECK_EQUAL(events.front().code, "190");
}

BOOST_AUTO_TEST_CASE(event_passive)
{
  const Verbs verbs;
  const Matcher matcher(verbs.dict, Config());
  
  token_set_type tokens = tokenize("(ROOT (S (NE GERMANY ~NE (VP1 (VBD WAS ~VBD (VP2 (VBN ATTACKED ~VBN (PP (IN BY ~IN (NE FRANCE ~NE ~PP ~VP2 ~VP1 (. . ~. ~S ~ROOT");
  resolve(tokens, 2, "GMY");
  resolve(tokens, 17, "FRA");
  
  event_set_type events;
  BOOST_CHECK(matcher(tokens, events).ok());
  
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().source.code, "FRA");
  BOOST_CHECK_EQUAL(events.front().target.code, "GMY");
  BOOST_CHECK_EQUAL(events.front().code, "190");
}

BOOST_AUTO_TEST_CASE(event_pattern)
{
  const Verbs verbs;
  const Matcher matcher(verbs.dict, Config());
  
  // the pattern code
  token_set_type tokens = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD WARNED ~VBD (PP (IN AGAINST ~IN (NE GERMANY ~NE ~PP ~VP1 ~S ~ROOT");
  resolve(tokens, 2, "FRA");
  resolve(tokens, 13, "GMY");
  
  event_set_type events;
  BOOST_CHECK(matcher(tokens, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().code, "138");
  BOOST_CHECK_EQUAL(events.front().target.code, "GMY");
  
  // the default code of the verb
  token_set_type plain = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD WARNED ~VBD (NE GERMANY ~NE ~VP1 ~S ~ROOT");
  resolve(plain, 2, "FRA");
  resolve(plain, 9, "GMY");
  
  events.clear();
  BOOST_CHECK(matcher(plain, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().code, "130");
}

BOOST_AUTO_TEST_CASE(event_multiword)
{
  const Verbs verbs;
  const Matcher matcher(verbs.dict, Config());
  
  token_set_type tokens = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD MET ~VBD (PP (IN WITH ~IN (NE GERMANY ~NE ~PP ~VP1 ~S ~ROOT");
  resolve(tokens, 2, "FRA");
  resolve(tokens, 13, "GMY");
  
  event_set_type events;
  BOOST_CHECK(matcher(tokens, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().code, "041");
  
  // without the particle
  token_set_type single = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD MET ~VBD (NE GERMANY ~NE ~VP1 ~S ~ROOT");
  resolve(single, 2, "FRA");
  resolve(single, 9, "GMY");
  
  events.clear();
  BOOST_CHECK(matcher(single, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().code, "040");
}

BOOST_AUTO_TEST_CASE(event_self)
{
  const Verbs verbs;
  const Matcher matcher(verbs.dict, Config());
  
  token_set_type tokens = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD ATTACKED ~VBD (NE FRANCE ~NE ~VP1 ~S ~ROOT");
  resolve(tokens, 2, "FRA");
  resolve(tokens, 9, "FRA");
  
  event_set_type events;
  BOOST_CHECK(matcher(tokens, events).ok());
  BOOST_CHECK(events.empty());
}

BOOST_AUTO_TEST_CASE(event_new_actor)
{
  const Verbs verbs;
  
  token_set_type tokens = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD ATTACKED ~VBD (NE GERMANY ~NE ~VP1 ~S ~ROOT");
  resolve(tokens, 2, "FRA");
  tokens[9].text = "GERMANY";
  
  // an unresolved target does not form a dyad
  event_set_type events;
  BOOST_CHECK(Matcher(verbs.dict, Config())(tokens, events).ok());
  BOOST_CHECK(events.empty());
  
  Config config;
  config.new_actor_length = 2;
  
  BOOST_CHECK(Matcher(verbs.dict, config)(tokens, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().source.code, "FRA");
  BOOST_CHECK_EQUAL(events.front().target.code, "\"GERMANY\"");
}

BOOST_AUTO_TEST_CASE(unknown_verb)
{
  const Verbs verbs;
  const Matcher matcher(verbs.dict, Config());
  
  token_set_type tokens = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD PRAISED ~VBD (NE GERMANY ~NE ~VP1 ~S ~ROOT");
  resolve(tokens, 2, "FRA");
  resolve(tokens, 9, "GMY");
  
  event_set_type events;
  BOOST_CHECK(matcher(tokens, events).ok());
  BOOST_CHECK(events.empty());
}

BOOST_AUTO_TEST_CASE(event_multiword_overlap)
{
  const Verbs verbs;
  const Matcher matcher(verbs.dict, Config());
  
  // the continuation defined last is tried first
  token_set_type tokens = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBP CARRY ~VBP (PRT OUT ~PRT (NN ATTACK ~NN (PP (IN ON ~IN (NE GERMANY ~NE ~PP ~VP1 ~S ~ROOT");
  resolve(tokens, 2, "FRA");
  resolve(tokens, 19, "GMY");
  
  event_set_type events;
  BOOST_CHECK(matcher(tokens, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().code, "190");
  BOOST_CHECK_EQUAL(events.front().target.code, "GMY");
  
  token_set_type shorter = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBP CARRY ~VBP (PRT OUT ~PRT (NE GERMANY ~NE ~VP1 ~S ~ROOT");
  resolve(shorter, 2, "FRA");
  resolve(shorter, 12, "GMY");
  
  events.clear();
  BOOST_CHECK(matcher(shorter, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().code, "050");
}

BOOST_AUTO_TEST_CASE(event_synset)
{
  const Verbs verbs;
  const Matcher matcher(verbs.dict, Config());
  
  token_set_type tokens = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD FOUGHT ~VBD (NE GERMANY ~NE (PP (IN WITH ~IN (NNS GUNS ~NNS ~PP ~VP1 ~S ~ROOT");
  resolve(tokens, 2, "FRA");
  resolve(tokens, 9, "GMY");
  
  event_set_type events;
  BOOST_CHECK(matcher(tokens, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().source.code, "FRA");
  BOOST_CHECK_EQUAL(events.front().target.code, "GMY");
  BOOST_CHECK_EQUAL(events.front().code, "195");
  
  // a member of several words
  token_set_type multi = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD FOUGHT ~VBD (NE GERMANY ~NE (PP (IN WITH ~IN (NP (NN ROCKET ~NN (NNS LAUNCHERS ~NNS ~NP ~PP ~VP1 ~S ~ROOT");
  resolve(multi, 2, "FRA");
  resolve(multi, 9, "GMY");
  
  events.clear();
  BOOST_CHECK(matcher(multi, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().code, "195");
  
  // not a member
  token_set_type other = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD FOUGHT ~VBD (NE GERMANY ~NE (PP (IN WITH ~IN (NNS KNIVES ~NNS ~PP ~VP1 ~S ~ROOT");
  resolve(other, 2, "FRA");
  resolve(other, 9, "GMY");
  
  events.clear();
  BOOST_CHECK(matcher(other, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().code, "190");
}

BOOST_AUTO_TEST_CASE(event_skip)
{
  const Verbs verbs;
  const Matcher matcher(verbs.dict, Config());
  
  // the first entity is skipped, and the target follows WITH
  token_set_type tokens = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD FOUGHT ~VBD (NE GERMANY ~NE (PP (IN WITH ~IN (NE ITALY ~NE ~PP ~VP1 ~S ~ROOT");
  resolve(tokens, 2, "FRA");
  resolve(tokens, 9, "GMY");
  resolve(tokens, 16, "ITA");
  
  event_set_type events;
  BOOST_CHECK(matcher(tokens, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().source.code, "FRA");
  BOOST_CHECK_EQUAL(events.front().target.code, "ITA");
  BOOST_CHECK_EQUAL(events.front().code, "196");
}

BOOST_AUTO_TEST_CASE(event_placement)
{
  const Verbs verbs;
  const Matcher matcher(verbs.dict, Config());
  
  // the target precedes the verb and the source follows BY
  token_set_type tokens = tokenize("(ROOT (S (NE GERMANY ~NE (VP1 (VBD PRAISED ~VBD (PP (IN BY ~IN (NE FRANCE ~NE ~PP ~VP1 ~S ~ROOT");
  resolve(tokens, 2, "GMY");
  resolve(tokens, 13, "FRA");
  
  sequence_type upper;
  sequence_type lower;
  Matcher::upper_sequence(tokens, 6, upper);
  BOOST_REQUIRE(Matcher::lower_sequence(tokens, 8, 17, lower));
  
  const VerbEntry* praise = verbs.dict.find("PRAISE");
  BOOST_REQUIRE(praise);
  BOOST_REQUIRE_EQUAL(praise->patterns.size(), size_t(1));
  
  Locator source;
  Locator target;
  BOOST_CHECK(matcher.match(praise->patterns.front().upper, upper, true, source, target) == Matcher::MATCH);
  BOOST_CHECK(matcher.match(praise->patterns.front().lower, lower, false, source, target) == Matcher::MATCH);
  
  BOOST_CHECK(source.valid());
  BOOST_CHECK(! source.upper);
  BOOST_CHECK_EQUAL(lower[source.index].position, size_t(13));
  BOOST_CHECK(target.valid());
  BOOST_CHECK(target.upper);
  BOOST_CHECK_EQUAL(upper[target.index].position, size_t(2));
  
  event_set_type events;
  BOOST_CHECK(matcher(tokens, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().source.code, "FRA");
  BOOST_CHECK_EQUAL(events.front().target.code, "GMY");
  BOOST_CHECK_EQUAL(events.front().code, "052");
}

BOOST_AUTO_TEST_CASE(event_adjacent)
{
  const Verbs verbs;
  const Matcher matcher(verbs.dict, Config());
  
  token_set_type adjacent = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD ACCUSED ~VBD (NE GERMANY ~NE (PP (IN OF ~IN (VBG ATTACKING ~VBG ~PP ~VP1 ~S ~ROOT");
  resolve(adjacent, 2, "FRA");
  resolve(adjacent, 9, "GMY");
  
  event_set_type events;
  BOOST_CHECK(matcher(adjacent, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().code, "1121");
  
  // a word between OF and ATTACKING
  token_set_type separated = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD ACCUSED ~VBD (NE GERMANY ~NE (PP (IN OF ~IN (RB BRUTALLY ~RB (VBG ATTACKING ~VBG ~PP ~VP1 ~S ~ROOT");
  resolve(separated, 2, "FRA");
  resolve(separated, 9, "GMY");
  
  events.clear();
  BOOST_CHECK(matcher(separated, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().code, "112");
  
  sequence_type lower;
  BOOST_REQUIRE(Matcher::lower_sequence(separated, 8, separated.size() - 3, lower));
  
  pattern_type pattern;
  pattern.push_back(PatternAtom(PatternAtom::LITERAL, "OF", ' '));
  pattern.push_back(PatternAtom(PatternAtom::LITERAL, "ATTACKING", '_'));
  
  Locator source;
  Locator target;
  BOOST_CHECK(matcher.match(pattern, lower, false, source, target) == Matcher::NO_MATCH);
  
  pattern.back().connector = ' ';
  BOOST_CHECK(matcher.match(pattern, lower, false, source, target) == Matcher::MATCH);
}

BOOST_AUTO_TEST_CASE(event_compound)
{
  const Verbs verbs;
  const Matcher matcher(verbs.dict, Config());
  
  token_set_type tokens = tokenize("(ROOT (S (NE GERMANY ~NE (VP1 (VBD NEGOTIATED ~VBD (PP (IN BETWEEN ~IN (NEC1 BOTH (NE FRANCE ~NE AND (NE BRITAIN ~NE ~NEC1 ~PP ~VP1 ~S ~ROOT");
  resolve(tokens, 2, "GMY");
  resolve(tokens, 15, "FRA");
  resolve(tokens, 19, "GBR");
  
  BOOST_REQUIRE(tokens[13].is_compound());
  BOOST_REQUIRE(tokens[24].is_close("VP"));
  
  sequence_type lower;
  BOOST_REQUIRE(Matcher::lower_sequence(tokens, 8, 24, lower));
  
  const VerbEntry* negotiate = verbs.dict.find("NEGOTIATE");
  BOOST_REQUIRE(negotiate);
  BOOST_REQUIRE_EQUAL(negotiate->patterns.size(), size_t(1));
  
  Locator source;
  Locator target;
  BOOST_CHECK(matcher.match(negotiate->patterns.front().lower, lower, false, source, target) == Matcher::MATCH);
  BOOST_REQUIRE(source.valid());
  BOOST_REQUIRE(target.valid());
  BOOST_CHECK_EQUAL(source.index, target.index);
  BOOST_CHECK(lower[source.index].kind == Token::COMPOUND);
  
  // every entity of the compound
  participant_set_type participants;
  BOOST_CHECK(matcher.participants(tokens, lower, source, participants));
  BOOST_REQUIRE_EQUAL(participants.size(), size_t(2));
  BOOST_CHECK_EQUAL(participants[0].code, "FRA");
  BOOST_CHECK_EQUAL(participants[1].code, "GBR");
  
  // the members act on each other
  event_set_type events;
  BOOST_CHECK(matcher(tokens, events).ok());
  BOOST_REQUIRE_EQUAL(events.size(), size_t(2));
  BOOST_CHECK_EQUAL(events[0].source.code, "FRA");
  BOOST_CHECK_EQUAL(events[0].target.code, "GBR");
  BOOST_CHECK_EQUAL(events[0].code, "0461");
  BOOST_CHECK_EQUAL(events[1].source.code, "GBR");
  BOOST_CHECK_EQUAL(events[1].target.code, "FRA");
}
