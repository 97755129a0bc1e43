//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <sstream>

#include "actor.hpp"
#include "reader.hpp"
#include "date.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE actor_test

#include <boost/test/unit_test.hpp>

using namespace laurel;

static const char* actors =
  "FRANCE_ [FRA]\n"
  "+FRENCH_\n"
  "UNITED_STATES [USA]\n"
  "UNITED_STATES_NAVY [USAMIL]\n"
  "JACQUES_CHIRAC_ [FRAELI]\n"
  "\t[FRAELI <19950516]\n"
  "\t[FRAGOV 19950517-20070516]\n"
  "BILL_CLINTON_\n"
  "\t[USAGOV 19930120-20010120]\n"
  "SLOBODAN_MILOSEVIC_\n"
  "\t[X <19981231]\n"
  "\t[Y >19990101]\n"
  "---STOP---\n"
  "GERMANY_ [GMY]\n";

static const char* agents =
  "!minist! = MINISTER, MINISTRY\n"
  "FOREIGN_!minist! [~GOV]\n"
  "POLICE {POLICE} [~COP]\n"
  "REBEL [REB~]\n"
  "NOCODE\n";

BOOST_AUTO_TEST_CASE(actor_dictionary)
{
  std::istringstream is(actors);
  Reader reader(is, "actors");
  
  ActorDictionary dict;
  dict.read(reader);
  
  const ActorDictionary::phrase_set_type* french = dict.find("FRENCH");
  BOOST_REQUIRE(french);
  BOOST_REQUIRE_EQUAL(french->size(), size_t(1));
  BOOST_CHECK_EQUAL(dict.code(french->front().slot).code, "FRA");
  BOOST_CHECK_EQUAL(dict.code(french->front().slot).root, "FRANCE_");
  
  // longest phrase first
  const ActorDictionary::phrase_set_type* united = dict.find("UNITED");
  BOOST_REQUIRE(united);
  BOOST_REQUIRE_EQUAL(united->size(), size_t(2));
  BOOST_CHECK_EQUAL(united->front().size(), size_t(3));
  BOOST_CHECK_EQUAL(dict.code(united->front().slot).code, "USAMIL");
  BOOST_CHECK_EQUAL(dict.code(united->back().slot).code, "USA");
  
  // nothing after ---STOP---
  BOOST_CHECK(! dict.find("GERMANY"));
}

BOOST_AUTO_TEST_CASE(date_restriction)
{
  std::istringstream is(actors);
  Reader reader(is, "actors");
  
  ActorDictionary dict;
  dict.read(reader);
  
  const ActorDictionary::phrase_set_type* jacques = dict.find("JACQUES");
  BOOST_REQUIRE(jacques);
  const ActorCode& chirac = dict.code(jacques->front().slot);
  
  BOOST_CHECK_EQUAL(chirac.resolve(date_ordinal("19900101")), "FRAELI");
  BOOST_CHECK_EQUAL(chirac.resolve(date_ordinal("19950517")), "FRAGOV");
  BOOST_CHECK_EQUAL(chirac.resolve(date_ordinal("20070516")), "FRAGOV");
  BOOST_CHECK_EQUAL(chirac.resolve(date_ordinal("20070517")), "FRAELI");
  
  const ActorDictionary::phrase_set_type* bill = dict.find("BILL");
  BOOST_REQUIRE(bill);
  const ActorCode& clinton = dict.code(bill->front().slot);
  
  // no default code
  BOOST_CHECK_EQUAL(clinton.resolve(date_ordinal("19950101")), "USAGOV");
  BOOST_CHECK_EQUAL(clinton.resolve(date_ordinal("20050101")), "---");
  
  const ActorDictionary::phrase_set_type* slobodan = dict.find("SLOBODAN");
  BOOST_REQUIRE(slobodan);
  const ActorCode& milosevic = dict.code(slobodan->front().slot);
  
  BOOST_CHECK_EQUAL(milosevic.resolve(date_ordinal("19981231")), "X");
  BOOST_CHECK_EQUAL(milosevic.resolve(date_ordinal("19990601")), "Y");
  BOOST_CHECK_EQUAL(milosevic.resolve(date_ordinal("19990101")), "Y");
}

BOOST_AUTO_TEST_CASE(agent_dictionary)
{
  std::istringstream is(agents);
  Reader reader(is, "agents");
  
  AgentDictionary dict;
  dict.read(reader);
  
  // singular and plural of both substitutions
  const AgentDictionary::phrase_set_type* foreign = dict.find("FOREIGN");
  BOOST_REQUIRE(foreign);
  BOOST_REQUIRE_EQUAL(foreign->size(), size_t(4));
  BOOST_CHECK_EQUAL(foreign->front().code, "~GOV");
  
  bool ministries = false;
  for (size_t i = 0; i != foreign->size(); ++ i)
    ministries |= ((*foreign)[i].words.size() == 1 && (*foreign)[i].words.front() == "MINISTRIES");
  BOOST_CHECK(ministries);
  
  const AgentDictionary::phrase_set_type* police = dict.find("POLICE");
  BOOST_REQUIRE(police);
  BOOST_CHECK_EQUAL(police->front().code, "~COP");
  
  const AgentDictionary::phrase_set_type* rebels = dict.find("REBELS");
  BOOST_REQUIRE(rebels);
  BOOST_CHECK_EQUAL(rebels->front().code, "REB~");
  
  // no code
  BOOST_CHECK(! dict.find("NOCODE"));
}
