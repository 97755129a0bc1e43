//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <sstream>
#include <cctype>
#include <cstdlib>

#include <boost/tokenizer.hpp>

#include "clause.hpp"
#include "token.hpp"

#include "utils/space_separator.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE clause_test

#include <boost/test/unit_test.hpp>

using namespace laurel;

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

std::string print(const token_set_type& tokens)
{
  std::ostringstream os;
  os << tokens;
  return os.str();
}

BOOST_AUTO_TEST_CASE(internal)
{
  const ClauseElision elision(2, 8, 0, 0, 0, 0);
  
  token_set_type tokens = tokenize("(ROOT (S (NE FRANCE ~NE (, , ~, (SBAR WHICH IS A COUNTRY ~SBAR (, , ~, "
				   "(VP1 (VBD ATTACKED ~VBD (NE GERMANY ~NE ~VP1 (. . ~. ~S ~ROOT");
  BOOST_REQUIRE(balanced(tokens));
  
  BOOST_CHECK(elision(tokens).ok());
  BOOST_CHECK_EQUAL(print(tokens), "(ROOT (S (NE --- FRANCE ~NE (, , ~, (, , ~, (VP1 (VBD ATTACKED ~VBD (NE --- GERMANY ~NE ~VP1 (. . ~. ~S ~ROOT");
  BOOST_CHECK(balanced(tokens));
  
  // too long to be removed
  token_set_type longer = tokenize("(ROOT (S (NE FRANCE ~NE (, , ~, (SBAR WHICH IS A VERY VERY VERY VERY LARGE COUNTRY ~SBAR (, , ~, "
				   "(VP1 (VBD ATTACKED ~VBD (NE GERMANY ~NE ~VP1 (. . ~. ~S ~ROOT");
  const token_set_type original(longer);
  
  BOOST_CHECK(elision(longer).ok());
  BOOST_CHECK_EQUAL(print(longer), print(original));
}

BOOST_AUTO_TEST_CASE(initial)
{
  token_set_type tokens = tokenize("(ROOT (S (PP ON MONDAY ~PP (, , ~, (NE FRANCE ~NE "
				   "(VP1 (VBD ATTACKED ~VBD (NE GERMANY ~NE ~VP1 (. . ~. ~S ~ROOT");
  const token_set_type original(tokens);
  
  // disabled by default
  BOOST_CHECK(ClauseElision(Config())(tokens).ok());
  BOOST_CHECK_EQUAL(print(tokens), print(original));
  
  // the clause and the comma left behind are removed
  BOOST_CHECK(ClauseElision(2, 8, 1, 5, 0, 0)(tokens).ok());
  BOOST_CHECK_EQUAL(print(tokens), "(ROOT (S (NE --- FRANCE ~NE (VP1 (VBD ATTACKED ~VBD (NE --- GERMANY ~NE ~VP1 (. . ~. ~S ~ROOT");
}

BOOST_AUTO_TEST_CASE(terminal)
{
  token_set_type tokens = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD ATTACKED ~VBD (NE GERMANY ~NE ~VP1 "
				   "(, , ~, (ADVP OFFICIALS SAID ~ADVP (. . ~. ~S ~ROOT");
  
  BOOST_CHECK(ClauseElision(2, 8, 0, 0, 1, 5)(tokens).ok());
  BOOST_CHECK_EQUAL(print(tokens), "(ROOT (S (NE --- FRANCE ~NE (VP1 (VBD ATTACKED ~VBD (NE --- GERMANY ~NE ~VP1 (. . ~. ~S ~ROOT");
}

BOOST_AUTO_TEST_CASE(no_comma)
{
  token_set_type tokens = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD ATTACKED ~VBD (NE GERMANY ~NE ~VP1 (. . ~. ~S ~ROOT");
  const token_set_type original(tokens);
  
  BOOST_CHECK(ClauseElision(2, 8, 1, 5, 1, 5)(tokens).ok());
  BOOST_CHECK_EQUAL(print(tokens), print(original));
}
