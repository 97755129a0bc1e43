//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <sstream>

#include "verb.hpp"
#include "reader.hpp"
#include "inflection.hpp"
#include "phrase.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE verb_test

#include <boost/test/unit_test.hpp>

using namespace laurel;

static const char* verbs = 
  "# verbs for testing\n"
  "--- ATTACK [190]\n"
  "ATTACK\n"
  "ASSAULT [191]\n"
  "BEAT {BEATS BEATEN BEATING}\n"
  "<!-- a comment\n"
  "     spanning lines -->\n"
  "&WEAPON\n"
  "+GUN\n"
  "+MISSILE_\n"
  "- $ * + [193]  # the basic pattern\n"
  "- * ON_+ [194]\n"
  "- * &WEAPON [195]\n"
  "- * &ARTILLERY [196]\n"
  "--- MEET [040]\n"
  "MEET {MEETS MET MEETING}\n"
  "+MET_WITH [041]\n";

BOOST_AUTO_TEST_CASE(inflection)
{
  BOOST_CHECK_EQUAL(plural("COUNTRY"), "COUNTRIES");
  BOOST_CHECK_EQUAL(plural("BUS"), "BUSES");
  BOOST_CHECK_EQUAL(plural("SOLDIER"), "SOLDIERS");
  
  const std::vector<std::string> attack = verb_forms("ATTACK");
  BOOST_CHECK_EQUAL(attack.size(), size_t(3));
  BOOST_CHECK_EQUAL(attack[0], "ATTACKS");
  BOOST_CHECK_EQUAL(attack[1], "ATTACKED");
  BOOST_CHECK_EQUAL(attack[2], "ATTACKING");
  
  const std::vector<std::string> praise = verb_forms("PRAISE");
  BOOST_CHECK_EQUAL(praise.size(), size_t(3));
  BOOST_CHECK_EQUAL(praise[0], "PRAISES");
  BOOST_CHECK_EQUAL(praise[1], "PRAISED");
  BOOST_CHECK_EQUAL(praise[2], "PRAISING");
}

BOOST_AUTO_TEST_CASE(phrase)
{
  Phrase strict;
  BOOST_CHECK(strict.assign("UNITED_STATES_NAVY"));
  BOOST_CHECK_EQUAL(strict.keyword, "UNITED");
  BOOST_CHECK_EQUAL(strict.size(), size_t(3));
  BOOST_CHECK_EQUAL(strict.connectors, "__");
  
  Phrase loose;
  BOOST_CHECK(loose.assign("UNITED NAVY"));
  BOOST_CHECK_EQUAL(loose.connectors, " ");
  
  phrase_type adjacent;
  adjacent.push_back("THE");
  adjacent.push_back("UNITED");
  adjacent.push_back("STATES");
  adjacent.push_back("NAVY");
  
  phrase_type separated;
  separated.push_back("UNITED");
  separated.push_back("STATES");
  separated.push_back("PACIFIC");
  separated.push_back("NAVY");
  
  BOOST_CHECK(strict.match(adjacent, 1));
  BOOST_CHECK(! strict.match(separated, 0));
  BOOST_CHECK(loose.match(adjacent, 1));
  BOOST_CHECK(loose.match(separated, 0));
  
  Phrase empty;
  BOOST_CHECK(! empty.assign(" _ "));
}

BOOST_AUTO_TEST_CASE(dictionary)
{
  std::istringstream is(verbs);
  Reader reader(is, "verbs");
  
  VerbDictionary dict;
  dict.read(reader);
  
  const VerbEntry* attack = dict.find("ATTACK");
  BOOST_REQUIRE(attack);
  BOOST_CHECK(attack->primary);
  BOOST_CHECK_EQUAL(attack->code, "190");
  
  // the fourth pattern refers to an undefined synset
  BOOST_CHECK_EQUAL(attack->patterns.size(), size_t(3));
  
  const VerbEntry* attacked = dict.find("ATTACKED");
  BOOST_REQUIRE(attacked);
  BOOST_CHECK(! attacked->primary);
  BOOST_CHECK_EQUAL(attacked->code, "190");
  BOOST_CHECK_EQUAL(dict.primary(*attacked), attack);
  
  const VerbEntry* assaulting = dict.find("ASSAULTING");
  BOOST_REQUIRE(assaulting);
  BOOST_CHECK_EQUAL(assaulting->code, "191");
  BOOST_CHECK_EQUAL(dict.primary(*assaulting), attack);
  
  // irregular forms replace the regular ones
  BOOST_CHECK(dict.find("BEATEN"));
  BOOST_CHECK(! dict.find("BEATED"));
  
  const VerbPattern& basic = attack->patterns[0];
  BOOST_CHECK_EQUAL(basic.code, "193");
  BOOST_REQUIRE_EQUAL(basic.upper.size(), size_t(1));
  BOOST_CHECK_EQUAL(basic.upper[0].kind, PatternAtom::SOURCE);
  BOOST_REQUIRE_EQUAL(basic.lower.size(), size_t(1));
  BOOST_CHECK_EQUAL(basic.lower[0].kind, PatternAtom::TARGET);
  
  const VerbPattern& on = attack->patterns[1];
  BOOST_CHECK(on.upper.empty());
  BOOST_REQUIRE_EQUAL(on.lower.size(), size_t(2));
  BOOST_CHECK_EQUAL(on.lower[0].kind, PatternAtom::LITERAL);
  BOOST_CHECK_EQUAL(on.lower[0].word, "ON");
  BOOST_CHECK_EQUAL(on.lower[1].kind, PatternAtom::TARGET);
  BOOST_CHECK_EQUAL(on.lower[1].connector, '_');
  
  const VerbDictionary::synset_type* weapon = dict.synset("&WEAPON");
  BOOST_REQUIRE(weapon);
  
  // GUN, GUNS and MISSILE: the trailing '_' suppresses the plural
  BOOST_REQUIRE_EQUAL(weapon->size(), size_t(3));
  BOOST_CHECK_EQUAL((*weapon)[1].front(), "GUNS");
  BOOST_CHECK_EQUAL((*weapon)[2].front(), "MISSILE");
  
  BOOST_CHECK_EQUAL(attack->patterns[2].lower[0].kind, PatternAtom::SYNSET);
  
  const VerbEntry* met = dict.find("MET");
  BOOST_REQUIRE(met);
  BOOST_CHECK_EQUAL(met->code, "040");
  
  const VerbEntry* meet = dict.find("MEET");
  BOOST_REQUIRE(meet);
  BOOST_REQUIRE_EQUAL(meet->multiwords.size(), size_t(0));
  
  // the multi-word verb is stored under its verb word
  BOOST_REQUIRE_EQUAL(met->multiwords.size(), size_t(1));
  BOOST_CHECK(met->multiwords[0].forward);
  BOOST_CHECK_EQUAL(met->multiwords[0].words.size(), size_t(1));
  BOOST_CHECK_EQUAL(met->multiwords[0].words[0], "WITH");
  BOOST_CHECK_EQUAL(met->multiwords[0].code, "041");
  BOOST_CHECK_EQUAL(met->multiwords[0].verb, "MEET");
}

BOOST_AUTO_TEST_CASE(multiword_order)
{
  std::istringstream is("--- CARRY [---]\n"
			"CARRY\n"
			"+CARRY_OUT [050]\n"
			"+CARRY_OUT_ATTACK [190]\n");
  Reader reader(is, "verbs");
  
  VerbDictionary dict;
  dict.read(reader);
  
  const VerbEntry* carry = dict.find("CARRY");
  BOOST_REQUIRE(carry);
  
  // the continuation defined last is tried first
  BOOST_REQUIRE_EQUAL(carry->multiwords.size(), size_t(2));
  BOOST_CHECK_EQUAL(carry->multiwords[0].code, "190");
  BOOST_REQUIRE_EQUAL(carry->multiwords[0].words.size(), size_t(2));
  BOOST_CHECK_EQUAL(carry->multiwords[0].words[1], "ATTACK");
  BOOST_CHECK_EQUAL(carry->multiwords[1].code, "050");
  BOOST_CHECK_EQUAL(carry->multiwords[1].verb, "CARRY");
}
