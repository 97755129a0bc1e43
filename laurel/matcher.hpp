// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__MATCHER__HPP__
#define __LAUREL__MATCHER__HPP__ 1

// verb pattern matching.
//
// for each verb phrase headed by a verb, the verb is looked up in the verb dictionary and its
// patterns are matched against the context of the verb:
//  upper: words and entities before the verb, from the verb backward to a comma or the beginning
//  lower: words and entities following the verb within the verb phrase
// the first pattern matching both contexts gives the event code, otherwise the default code of the verb.
// Source and target are given by the pattern, or by the default rules.
//

#include <string>
#include <vector>

#include "token.hpp"
#include "verb.hpp"
#include "event.hpp"
#include "failure.hpp"
#include "config.hpp"

namespace laurel
{
  struct Element
  {
    Element() : kind(Token::WORD), word(), position(0) {}
    Element(const Token& token, const size_t __position)
      : kind(token.kind), word(token.is_word() ? token.label : std::string()), position(__position) {}
    
    Token::kind_type kind;
    std::string      word;      // empty unless WORD
    size_t           position;  // position in the tokens
  };
  
  typedef std::vector<Element, std::allocator<Element> > sequence_type;
  
  // position of an entity, or a compound, in either context
  struct Locator
  {
    Locator() : index(-1), upper(true) {}
    Locator(const int __index, const bool __upper) : index(__index), upper(__upper) {}
    
    bool valid() const { return index >= 0; }
    
    int  index;
    bool upper;
  };
  
  class Matcher
  {
  public:
    typedef enum {
      MATCH,
      NO_MATCH,
      ERROR,
    } match_type;
    
  public:
    Matcher(const VerbDictionary& __verbs, const Config& __config)
      : verbs(__verbs), config(__config) {}
    
  public:
    // events found in tokens are appended to events
    Failure operator()(const token_set_type& tokens, event_set_type& events) const;
    
    // match a pattern against a context. The locators are set by $, + and %
    match_type match(const pattern_type& pattern,
		     const sequence_type& sequence,
		     const bool upper,
		     Locator& source,
		     Locator& target) const;
    
    // position of the past participle when the verb phrase is passive, otherwise zero
    static size_t passive(const token_set_type& tokens, const size_t pos_vp, const size_t pos_vp_end);
    
    // walk backward from first
    static void upper_sequence(const token_set_type& tokens, const size_t first, sequence_type& sequence);
    
    // walk forward from first to the end of the verb phrase. false when out of bounds
    static bool lower_sequence(const token_set_type& tokens, const size_t first, const size_t last, sequence_type& sequence);
    
    // the multi-word verb adjacent to the verb at pos. first_upper and first_lower are the starting
    // positions of the contexts
    static bool multiword(const token_set_type& tokens,
			  const MultiWord& multi,
			  const size_t pos,
			  const size_t pos_vp_end,
			  size_t& first_upper,
			  size_t& first_lower);
    
    // codes at the locator. false when the compound is not closed
    bool participants(const token_set_type& tokens,
		      const sequence_type& sequence,
		      const Locator& locator,
		      participant_set_type& participants) const;
    
    Locator find_source(const token_set_type& tokens, const sequence_type& upper) const;
    
    Locator find_target(const token_set_type& tokens,
			const sequence_type& upper,
			const sequence_type& lower,
			const Locator& source) const;
    
  private:
    bool synset_match(const std::string& name, const sequence_type& sequence, size_t& pos, const bool upper) const;
    
  private:
    const VerbDictionary& verbs;
    Config                config;
  };
};

#endif
