// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__RESOLVER__HPP__
#define __LAUREL__RESOLVER__HPP__ 1

// assign actor codes to entities.
// An entity holding a compound is expanded into a compound of entities, one for each head,
// sharing the words around the compound. Then, for each entity, the first actor found
// from the left is composed with all the agents found in the entity.
//

#include <string>

#include "token.hpp"
#include "phrase.hpp"
#include "actor.hpp"

namespace laurel
{
  class Resolver
  {
  public:
    // result of a single phrase
    struct Result
    {
      Result() : code(), root() {}
      
      bool found() const { return ! code.empty(); }
      
      std::string code;  // empty when neither actor nor agent is found
      std::string root;  // root phrase of the actor
    };
    
  public:
    Resolver(const ActorDictionary& __actors, const AgentDictionary& __agents)
      : actors(__actors), agents(__agents) {}
    
  public:
    // resolve every entity of tokens for the date ordinal
    void operator()(token_set_type& tokens, const int ordinal) const;
    
    Result resolve(const phrase_type& phrase, const int ordinal) const;
    
    // expand the compound inside the entity starting at pos.
    // Returns the position following the expansion, or pos when no compound is found
    static size_t expand(token_set_type& tokens, const size_t pos);
    
    // attach an agent code, ~XXX after the actor code and XXX~ before it, unless
    // already present at a three character boundary
    static void compose(std::string& code, const std::string& agent);
    
  private:
    const ActorDictionary& actors;
    const AgentDictionary& agents;
  };
};

#endif
