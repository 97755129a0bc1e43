//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <sstream>

#include "token.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE token_test

#include <boost/test/unit_test.hpp>

using namespace laurel;

BOOST_AUTO_TEST_CASE(kinds)
{
  const Token entity = Token::entity();
  
  BOOST_CHECK(entity.is_entity());
  BOOST_CHECK(entity.is_opening());
  BOOST_CHECK(! entity.resolved());
  BOOST_CHECK_EQUAL(entity.code, Token::unresolved());
  
  BOOST_CHECK(Token::open("NP", 1).is_open("NP"));
  BOOST_CHECK(! Token::open("NP", 1).is_open("VP"));
  BOOST_CHECK(Token::close("VP", 2).is_close("VP"));
  BOOST_CHECK(Token::word("FRANCE").is_word());
  BOOST_CHECK(Token::compound_end(1).is_closing());
  
  BOOST_CHECK(Token::open("VP", 1).closed_by(Token::close("VP", 1)));
  BOOST_CHECK(! Token::open("VP", 1).closed_by(Token::close("VP", 2)));
  BOOST_CHECK(! Token::open("VP", 1).closed_by(Token::close("NP", 1)));
  BOOST_CHECK(Token::compound(3).closed_by(Token::compound_end(3)));
  BOOST_CHECK(! Token::compound(3).closed_by(Token::compound_end(2)));
}

BOOST_AUTO_TEST_CASE(balance)
{
  token_set_type tokens;
  tokens.push_back(Token::open("ROOT"));
  tokens.push_back(Token::open("S"));
  tokens.push_back(Token::entity());
  tokens.push_back(Token::word("FRANCE"));
  tokens.push_back(Token::entity_end());
  tokens.push_back(Token::open("VP", 1));
  tokens.push_back(Token::word("ATTACKED"));
  tokens.push_back(Token::close("VP", 1));
  tokens.push_back(Token::close("S"));
  tokens.push_back(Token::close("ROOT"));
  
  BOOST_CHECK(balanced(tokens));
  
  BOOST_CHECK_EQUAL(find_close(tokens, 0), size_t(9));
  BOOST_CHECK_EQUAL(find_close(tokens, 2), size_t(4));
  BOOST_CHECK_EQUAL(find_close(tokens, 5), size_t(7));
  
  // not an opening token
  BOOST_CHECK_EQUAL(find_close(tokens, 3), tokens.size());
  
  token_set_type mismatched(tokens);
  mismatched[7] = Token::close("VP", 2);
  
  BOOST_CHECK(! balanced(mismatched));
  BOOST_CHECK_EQUAL(find_close(mismatched, 5), mismatched.size());
  
  token_set_type truncated(tokens.begin(), tokens.end() - 1);
  
  BOOST_CHECK(! balanced(truncated));
  BOOST_CHECK_EQUAL(find_close(truncated, 0), truncated.size());
}

BOOST_AUTO_TEST_CASE(output)
{
  token_set_type tokens;
  tokens.push_back(Token::open("VP", 1));
  tokens.push_back(Token::word("ATTACKED"));
  tokens.push_back(Token::entity());
  tokens.push_back(Token::word("GERMANY"));
  tokens.push_back(Token::entity_end());
  tokens.push_back(Token::close("VP", 1));
  
  tokens[2].code = "GMY";
  
  std::ostringstream os;
  os << tokens;
  
  BOOST_CHECK_EQUAL(os.str(), "(VP1 ATTACKED (NE GMY GERMANY ~NE ~VP1");
}
