//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <sstream>

#include "event.hpp"
#include "token.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE event_test

#include <boost/test/unit_test.hpp>

using namespace laurel;

participant_set_type participants(const std::string& first, const std::string& second = std::string())
{
  participant_set_type result;
  result.push_back(Participant(first));
  if (! second.empty())
    result.push_back(Participant(second));
  return result;
}

BOOST_AUTO_TEST_CASE(assemble)
{
  const Assembler assembler(true);
  
  event_set_type events;
  BOOST_CHECK(assembler(participants("FRA"), participants("GMY"), "190", false, events));
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().source.code, "FRA");
  BOOST_CHECK_EQUAL(events.front().target.code, "GMY");
  BOOST_CHECK_EQUAL(events.front().code, "190");
  
  std::ostringstream os;
  os << events.front();
  BOOST_CHECK_EQUAL(os.str(), "FRA GMY 190");
  
  // passive voice swaps the roles
  events.clear();
  BOOST_CHECK(assembler(participants("GMY"), participants("FRA"), "190", true, events));
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().source.code, "FRA");
  BOOST_CHECK_EQUAL(events.front().target.code, "GMY");
  
  events.clear();
  BOOST_CHECK(! assembler(participant_set_type(), participants("GMY"), "190", false, events));
  BOOST_CHECK(events.empty());
}

BOOST_AUTO_TEST_CASE(self_reference)
{
  const Assembler assembler(true);
  
  event_set_type events;
  BOOST_CHECK(assembler(participants("FRA", "GMY"), participants("GMY"), "190", false, events));
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().source.code, "FRA");
}

BOOST_AUTO_TEST_CASE(expand)
{
  participant_set_type expanded;
  expanded.push_back(Participant("FRA/GBR", "FRANCE_", "FRANCE AND BRITAIN"));
  expanded.push_back(Participant("USA"));
  
  Assembler::expand(expanded);
  
  BOOST_REQUIRE_EQUAL(expanded.size(), size_t(3));
  BOOST_CHECK_EQUAL(expanded[0].code, "FRA");
  BOOST_CHECK_EQUAL(expanded[0].root, "FRANCE_");
  BOOST_CHECK_EQUAL(expanded[1].code, "GBR");
  BOOST_CHECK_EQUAL(expanded[1].text, "FRANCE AND BRITAIN");
  BOOST_CHECK_EQUAL(expanded[2].code, "USA");
  
  const Assembler assembler(true);
  
  event_set_type events;
  BOOST_CHECK(assembler(participants("FRA/GBR"), participants("GMY"), "190", false, events));
  BOOST_REQUIRE_EQUAL(events.size(), size_t(2));
  BOOST_CHECK_EQUAL(events[0].source.code, "FRA");
  BOOST_CHECK_EQUAL(events[1].source.code, "GBR");
}

BOOST_AUTO_TEST_CASE(symmetric)
{
  const Assembler assembler(true);
  
  event_set_type events;
  BOOST_CHECK(assembler(participants("FRA"), participants("GMY"), "057:058", false, events));
  BOOST_REQUIRE_EQUAL(events.size(), size_t(2));
  
  BOOST_CHECK_EQUAL(events[0].source.code, "FRA");
  BOOST_CHECK_EQUAL(events[0].target.code, "GMY");
  BOOST_CHECK_EQUAL(events[0].code, "057");
  
  BOOST_CHECK_EQUAL(events[1].source.code, "GMY");
  BOOST_CHECK_EQUAL(events[1].target.code, "FRA");
  BOOST_CHECK_EQUAL(events[1].code, "058");
}

BOOST_AUTO_TEST_CASE(dyad)
{
  event_set_type events;
  
  BOOST_CHECK(Assembler(true)(participants("FRA"), participants(Token::unresolved()), "190", false, events));
  BOOST_CHECK(events.empty());
  
  BOOST_CHECK(Assembler(false)(participants("FRA"), participants(Token::unresolved()), "190", false, events));
  BOOST_REQUIRE_EQUAL(events.size(), size_t(1));
  BOOST_CHECK_EQUAL(events.front().target.code, Token::unresolved());
}

BOOST_AUTO_TEST_CASE(duplicate)
{
  const Assembler assembler(true);
  
  event_set_type events;
  BOOST_CHECK(assembler(participants("FRA", "FRA"), participants("GMY"), "190", false, events));
  BOOST_CHECK_EQUAL(events.size(), size_t(1));
  
  // duplicates of the events already found
  BOOST_CHECK(assembler(participants("FRA"), participants("GMY"), "190", false, events));
  BOOST_CHECK_EQUAL(events.size(), size_t(1));
  
  BOOST_CHECK(assembler(participants("FRA"), participants("GMY"), "191", false, events));
  BOOST_CHECK_EQUAL(events.size(), size_t(2));
}
