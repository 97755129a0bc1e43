//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <sstream>

#include "discard.hpp"
#include "issue.hpp"
#include "reader.hpp"
#include "inflection.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE discard_test

#include <boost/test/unit_test.hpp>

using namespace laurel;

BOOST_AUTO_TEST_CASE(discard)
{
  std::istringstream is("baseball_\n"
			"+SOCCER\n"
			"SPORT\n");
  Reader reader(is, "discards");
  
  DiscardList discards;
  discards.read(reader);
  
  BOOST_CHECK_EQUAL(discards.phrases.size(), size_t(3));
  
  // story discards take precedence
  const DiscardList::Result story = discards.check("THE SOCCER TEAM PLAYED BASEBALL");
  BOOST_CHECK_EQUAL(story.type, DiscardList::STORY);
  BOOST_CHECK_EQUAL(story.phrase, "SOCCER");
  
  const DiscardList::Result terminal = discards.check("HE PLAYED BASEBALL.");
  BOOST_CHECK_EQUAL(terminal.type, DiscardList::SENTENCE);
  BOOST_CHECK_EQUAL(terminal.phrase, "BASEBALL");
  
  BOOST_CHECK_EQUAL(discards.check("BASEBALLS ARE ROUND").type, DiscardList::NONE);
  
  // a stem
  const DiscardList::Result stem = discards.check("SPORTSMEN GATHERED");
  BOOST_CHECK_EQUAL(stem.type, DiscardList::SENTENCE);
  BOOST_CHECK_EQUAL(stem.phrase, "SPORT");
  
  // phrases start at a word
  BOOST_CHECK_EQUAL(discards.check("TRANSPORTS ARRIVED").type, DiscardList::NONE);
}

BOOST_AUTO_TEST_CASE(issue)
{
  std::istringstream is("n:PROTESTER [PROTEST]\n"
			"v:PROTEST [PROTEST]\n"
			"HUMAN+RIGHTS [RIGHTS]\n"
			"~FOOTBALL\n"
			"NOCODE\n");
  Reader reader(is, "issues");
  
  IssueList issues;
  issues.read(reader);
  
  // PROTESTER PROTESTERS, PROTEST PROTESTS PROTESTED PROTESTING, HUMAN RIGHTS HUMAN-RIGHTS, FOOTBALL
  BOOST_CHECK_EQUAL(issues.phrases.size(), size_t(9));
  
  const IssueList::issue_set_type coded = issues.code("PROTESTERS  PROTESTED OVER HUMAN-RIGHTS ABUSES");
  
  BOOST_REQUIRE_EQUAL(coded.size(), size_t(2));
  BOOST_CHECK_EQUAL(coded[0].first, "PROTEST");
  BOOST_CHECK_EQUAL(coded[0].second, 2);
  BOOST_CHECK_EQUAL(coded[1].first, "RIGHTS");
  BOOST_CHECK_EQUAL(coded[1].second, 1);
  
  std::ostringstream os;
  os << coded;
  BOOST_CHECK_EQUAL(os.str(), "PROTEST,2;RIGHTS,1");
  
  // an ignore phrase suppresses everything
  BOOST_CHECK(issues.code("PROTESTERS AT THE FOOTBALL MATCH").empty());
  
  BOOST_CHECK(issues.code("NOTHING HAPPENED").empty());
}

BOOST_AUTO_TEST_CASE(issue_plural)
{
  BOOST_CHECK_EQUAL(plural_issue("MILITIA"), "MILITIAS");
  BOOST_CHECK_EQUAL(plural_issue("ECONOMY"), "ECONOMIES");
  BOOST_CHECK_EQUAL(plural_issue("BUS"), "BUSS");
  
  std::istringstream is("n:CENSUS [CENSUS]\n"
			"n:ECONOMY [ECONOMY]\n");
  Reader reader(is, "issues");
  
  IssueList issues;
  issues.read(reader);
  
  BOOST_CHECK_EQUAL(issues.phrases.size(), size_t(4));
  
  const IssueList::issue_set_type census = issues.code("THE CENSUSS WERE TAKEN");
  BOOST_REQUIRE_EQUAL(census.size(), size_t(1));
  BOOST_CHECK_EQUAL(census[0].first, "CENSUS");
  
  BOOST_CHECK(issues.code("THE CENSUSES WERE TAKEN").empty());
  
  const IssueList::issue_set_type economy = issues.code("TWO ECONOMIES GREW");
  BOOST_REQUIRE_EQUAL(economy.size(), size_t(1));
  BOOST_CHECK_EQUAL(economy[0].first, "ECONOMY");
}
