// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__NORMALIZER__HPP__
#define __LAUREL__NORMALIZER__HPP__ 1

// conversion of a bracketed parse into a flat token sequence.
//
// noun phrases are collapsed into entities:
//  (NP ...) without nested noun phrases        -> (NE --- words ~NE
//  (NP ... (POS 'S) ...)                       -> (NE --- words without the possessive ~NE
//  (NP (NP ...) (PP (IN ...) (NP|NEC ...)))    -> (NE --- words ~NE, unless nested prepositions
//  otherwise                                   -> (NP<index> ... ~NP<index>
// coordinated noun phrases become compounds:
//  (NEC<index> (NE --- adjectives head ~NE ... ~NEC<index>
// subordinate clauses inside noun phrases become (SBR words ~SBR
// verb phrases are numbered, (VP<index> ... ~VP<index>
//

#include <string>

#include "token.hpp"
#include "phrase.hpp"
#include "treebank.hpp"
#include "failure.hpp"

namespace laurel
{
  class Normalizer
  {
  public:
    Normalizer() {}
    
    // parse is expected to be uppercased
    Failure operator()(const std::string& parse, token_set_type& tokens) const;
    
    Failure operator()(const Treebank& treebank, token_set_type& tokens) const;
  };
};

#endif
