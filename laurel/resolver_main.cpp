//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <sstream>
#include <cctype>
#include <cstdlib>

#include <boost/tokenizer.hpp>

#include "resolver.hpp"
#include "actor.hpp"
#include "reader.hpp"
#include "date.hpp"
#include "token.hpp"

#include "utils/space_separator.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE resolver_test

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

struct Dictionaries
{
  Dictionaries()
  {
    std::istringstream is_actor("FRANCE_ [FRA]\n"
				"PARIS_ [FRA]\n"
				"LONDON_ [GBR]\n"
				"UNITED_STATES [USA]\n"
				"UNITED_STATES_NAVY [USAMIL]\n"
				"SLOBODAN_MILOSEVIC_\n"
				"\t[X <19981231]\n"
				"\t[Y >19990101]\n");
    std::istringstream is_agent("POLICE {POLICE} [~COP]\n"
				"REBEL [REB~]\n"
				"MINISTER [~GOV]\n");
    
    Reader reader_actor(is_actor, "actors");
    Reader reader_agent(is_agent, "agents");
    
    actors.read(reader_actor);
    agents.read(reader_agent);
  }
  
  ActorDictionary actors;
  AgentDictionary agents;
};

phrase_type phrase(const std::string& text)
{
  typedef boost::tokenizer<utils::space_separator> tokenizer_type;
  
  tokenizer_type tokenizer(text);
  return phrase_type(tokenizer.begin(), tokenizer.end());
}

BOOST_AUTO_TEST_CASE(compose)
{
  std::string code = "USA";
  
  Resolver::compose(code, "~GOV");
  BOOST_CHECK_EQUAL(code, "USAGOV");
  
  // already present
  Resolver::compose(code, "~GOV");
  BOOST_CHECK_EQUAL(code, "USAGOV");
  
  Resolver::compose(code, "REB~");
  BOOST_CHECK_EQUAL(code, "REBUSAGOV");
  
  code = "---";
  Resolver::compose(code, "~COP");
  BOOST_CHECK_EQUAL(code, "---COP");
  
  // without a marker the code is attached at the back
  code = "FRA";
  Resolver::compose(code, "MIL");
  BOOST_CHECK_EQUAL(code, "FRAMIL");
}

BOOST_AUTO_TEST_CASE(resolve)
{
  const Dictionaries dict;
  const Resolver resolver(dict.actors, dict.agents);
  const int ordinal = date_ordinal("20150101");
  
  // longest match
  BOOST_CHECK_EQUAL(resolver.resolve(phrase("UNITED STATES NAVY"), ordinal).code, "USAMIL");
  BOOST_CHECK_EQUAL(resolver.resolve(phrase("UNITED STATES"), ordinal).code, "USA");
  BOOST_CHECK_EQUAL(resolver.resolve(phrase("THE UNITED STATES ARMY"), ordinal).code, "USA");
  
  const Resolver::Result police = resolver.resolve(phrase("FRANCE POLICE"), ordinal);
  BOOST_CHECK_EQUAL(police.code, "FRACOP");
  BOOST_CHECK_EQUAL(police.root, "FRANCE_");
  
  BOOST_CHECK_EQUAL(resolver.resolve(phrase("REBELS IN FRANCE"), ordinal).code, "REBFRA");
  BOOST_CHECK_EQUAL(resolver.resolve(phrase("POLICE AND MORE POLICE"), ordinal).code, "---COP");
  
  // the first actor from the left
  BOOST_CHECK_EQUAL(resolver.resolve(phrase("LONDON AND PARIS"), ordinal).code, "GBR");
  
  BOOST_CHECK(! resolver.resolve(phrase("NOBODY"), ordinal).found());
  
  BOOST_CHECK_EQUAL(resolver.resolve(phrase("SLOBODAN MILOSEVIC"), date_ordinal("19981231")).code, "X");
  BOOST_CHECK_EQUAL(resolver.resolve(phrase("SLOBODAN MILOSEVIC"), date_ordinal("19990601")).code, "Y");
}

BOOST_AUTO_TEST_CASE(entities)
{
  const Dictionaries dict;
  const Resolver resolver(dict.actors, dict.agents);
  
  token_set_type tokens = tokenize("(ROOT (S (NE FRANCE ~NE (VP1 (VBD ATTACKED ~VBD (NE GERMANY ~NE ~VP1 ~S ~ROOT");
  
  resolver(tokens, date_ordinal("20150101"));
  
  BOOST_CHECK_EQUAL(print(tokens), "(ROOT (S (NE FRA FRANCE ~NE (VP1 (VBD ATTACKED ~VBD (NE --- GERMANY ~NE ~VP1 ~S ~ROOT");
  BOOST_CHECK_EQUAL(tokens[2].root, "FRANCE_");
  BOOST_CHECK_EQUAL(tokens[2].text, "FRANCE");
  BOOST_CHECK(! tokens[9].resolved());
  BOOST_CHECK_EQUAL(tokens[9].text, "GERMANY");
}

BOOST_AUTO_TEST_CASE(expansion)
{
  const Dictionaries dict;
  const Resolver resolver(dict.actors, dict.agents);
  
  token_set_type tokens = tokenize("(ROOT (S (NE (NEC (NNP PARIS ~NNP (CC AND ~CC (NNP LONDON ~NNP ~NEC IN EUROPE ~NE "
				   "(VP1 (VBD MET ~VBD ~VP1 ~S ~ROOT");
  BOOST_REQUIRE(balanced(tokens));
  
  resolver(tokens, date_ordinal("20150101"));
  
  BOOST_CHECK_EQUAL(print(tokens), "(ROOT (S (NEC (NE FRA PARIS IN EUROPE ~NE (NE GBR LONDON IN EUROPE ~NE ~NEC (VP1 (VBD MET ~VBD ~VP1 ~S ~ROOT");
  BOOST_CHECK(balanced(tokens));
}
