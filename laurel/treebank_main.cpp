//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <sstream>

#include "treebank.hpp"
#include "normalizer.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE treebank_test

#include <boost/test/unit_test.hpp>

using namespace laurel;

template <typename Tp>
std::string print(const Tp& x)
{
  std::ostringstream os;
  os << x;
  return os.str();
}

BOOST_AUTO_TEST_CASE(treebank)
{
  Treebank tree;
  
  BOOST_CHECK(tree.assign("(ROOT (S (NP (NNP FRANCE)) (VP (VBD ATTACKED) (NP (NNP GERMANY))) (. .)))"));
  BOOST_CHECK_EQUAL(tree.cat, "ROOT");
  BOOST_REQUIRE_EQUAL(tree.antecedents.size(), size_t(1));
  BOOST_CHECK_EQUAL(tree.antecedents.front().antecedents.size(), size_t(3));
  BOOST_CHECK(tree.antecedents.front().antecedents.front().antecedents.front().preterminal());
  
  // without the ROOT label, or without the ROOT node
  BOOST_CHECK(tree.assign("( (S (NN X)))"));
  BOOST_CHECK_EQUAL(print(tree), "(ROOT (S (NN X)))");
  
  BOOST_CHECK(tree.assign("(S (NP (NNP A)) (VP (VBD B)))"));
  BOOST_CHECK_EQUAL(print(tree), "(ROOT (S (NP (NNP A)) (VP (VBD B))))");
  
  BOOST_CHECK(! tree.assign("(ROOT )"));
  BOOST_CHECK(! tree.assign("(ROOT (S (NN X))) trailing"));
}

BOOST_AUTO_TEST_CASE(normalize)
{
  Normalizer normalizer;
  token_set_type tokens;
  
  BOOST_CHECK(normalizer("(ROOT (S (NP (NNP FRANCE)) (VP (VBD ATTACKED) (NP (NNP GERMANY))) (. .)))", tokens).ok());
  BOOST_CHECK_EQUAL(print(tokens), "(ROOT (S (NE --- FRANCE ~NE (VP1 (VBD ATTACKED ~VBD (NE --- GERMANY ~NE ~VP1 (. . ~. ~S ~ROOT");
  BOOST_CHECK(balanced(tokens));
  
  // possessive
  BOOST_CHECK(normalizer("(ROOT (S (NP (NP (NNP FRANCE) (POS 'S)) (NN PRESIDENT)) (VP (VBD SPOKE))))", tokens).ok());
  BOOST_CHECK_EQUAL(print(tokens), "(ROOT (S (NE --- FRANCE PRESIDENT ~NE (VP1 (VBD SPOKE ~VBD ~VP1 ~S ~ROOT");
  
  // prepositional phrase
  BOOST_CHECK(normalizer("(ROOT (S (NP (NP (NNS MINISTERS)) (PP (IN OF) (NP (NNP FRANCE)))) (VP (VBD MET))))", tokens).ok());
  BOOST_CHECK_EQUAL(print(tokens), "(ROOT (S (NE --- MINISTERS OF FRANCE ~NE (VP1 (VBD MET ~VBD ~VP1 ~S ~ROOT");
}

BOOST_AUTO_TEST_CASE(compound)
{
  Normalizer normalizer;
  token_set_type tokens;
  
  BOOST_CHECK(normalizer("(ROOT (S (NP (NNP FRANCE) (CC AND) (NNP GERMANY)) (VP (VBD ATTACKED) (NP (NNP RUSSIA))) (. .)))", tokens).ok());
  BOOST_CHECK_EQUAL(print(tokens), "(ROOT (S (NEC1 (NE --- FRANCE ~NE (NE --- GERMANY ~NE ~NEC1 (VP1 (VBD ATTACKED ~VBD (NE --- RUSSIA ~NE ~VP1 (. . ~. ~S ~ROOT");
  BOOST_CHECK(balanced(tokens));
  
  // adjectives are shared by the heads
  BOOST_CHECK(normalizer("(ROOT (S (NP (JJ FRENCH) (NNS SOLDIERS) (CC AND) (NNS POLICE)) (VP (VBD LEFT))))", tokens).ok());
  BOOST_CHECK_EQUAL(print(tokens), "(ROOT (S (NEC1 (NE --- FRENCH SOLDIERS ~NE (NE --- FRENCH POLICE ~NE ~NEC1 (VP1 (VBD LEFT ~VBD ~VP1 ~S ~ROOT");
}

BOOST_AUTO_TEST_CASE(failures)
{
  Normalizer normalizer;
  token_set_type tokens;
  
  const Failure unbalanced = normalizer("(ROOT (S (NP (NNP FRANCE))", tokens);
  BOOST_CHECK_EQUAL(unbalanced.tag(), Failure::BAD_INPUT_PARSE);
  BOOST_CHECK(tokens.empty());
  
  BOOST_CHECK_EQUAL(normalizer("(ROOT )", tokens).tag(), Failure::BAD_INPUT_PARSE);
  
  const Failure dateline = normalizer("(ROOT (NP (NP (NNP PARIS) (CC AND) (NNP LONDON)) (PP (IN IN) (NP (NNP EUROPE)))))", tokens);
  BOOST_CHECK_EQUAL(dateline.tag(), Failure::DATELINE);
  BOOST_CHECK(tokens.empty());
}
