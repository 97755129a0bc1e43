// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__ACTOR__HPP__
#define __LAUREL__ACTOR__HPP__ 1

// actor and agent dictionaries
//
// actors:
// FRANCE_ [FRA]
// +FRENCH_                   synonym
// JACQUES_CHIRAC_ [FRAGOV]
// 	[FRAELI <19950517]       date restrictions: before, after (>) or an interval 19950517-20070516
// 	[FRAGOV 19950517-20070516]
// ---STOP---
//
// agents:
// !minist! = MINISTER, MINISTRY
// FOREIGN_!minist! [~GOV]    ~XXX is attached after the actor code, XXX~ before
// POLICE {POLICE} [~COP]     explicit plural, {} for none
//

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include <utils/unordered_map.hpp>

#include "phrase.hpp"

namespace laurel
{
  class Reader;
  
  // codes of an actor, possibly restricted by dates
  struct ActorCode
  {
    struct Restriction
    {
      typedef enum {
	BEFORE,
	AFTER,
	INTERVAL,
      } kind_type;
      
      Restriction(const kind_type& __kind, const int __first, const int __last, const std::string& __code)
	: kind(__kind), first(__first), last(__last), code(__code) {}
      
      bool match(const int ordinal) const
      {
	switch (kind) {
	case BEFORE:   return ordinal <= first;
	case AFTER:    return ordinal >= first;
	case INTERVAL: return first <= ordinal && ordinal <= last;
	}
	return false;
      }
      
      kind_type   kind;
      int         first;
      int         last;
      std::string code;
    };
    
    typedef std::vector<Restriction, std::allocator<Restriction> > restriction_set_type;
    
    ActorCode() : code(), restrictions(), root() {}
    
    // the first matching restriction, then the default code, otherwise unresolved
    const std::string& resolve(const int ordinal) const;
    
    std::string          code;   // default, may be empty
    restriction_set_type restrictions;
    std::string          root;   // primary phrase
  };
  
  struct ActorPhrase : public Phrase
  {
    ActorPhrase() : Phrase(), slot(0) {}
    
    size_t slot;
  };
  
  struct AgentPhrase : public Phrase
  {
    AgentPhrase() : Phrase(), code() {}
    
    std::string code;
  };
  
  class ActorDictionary
  {
  public:
    typedef boost::filesystem::path path_type;
    
    typedef std::vector<ActorPhrase, std::allocator<ActorPhrase> > phrase_set_type;
    typedef std::vector<ActorCode, std::allocator<ActorCode> >     code_set_type;
    
    typedef utils::unordered_map<std::string, phrase_set_type>::type phrase_map_type;
    
  public:
    ActorDictionary() {}
    
    // successive reads accumulate
    void read(const path_type& path);
    void read(Reader& reader);
    
    const phrase_set_type* find(const std::string& keyword) const
    {
      phrase_map_type::const_iterator iter = phrases.find(keyword);
      return (iter != phrases.end() ? &(iter->second) : 0);
    }
    
    const ActorCode& code(const size_t slot) const { return codes[slot]; }
    
    bool empty() const { return phrases.empty(); }
    
  public:
    phrase_map_type phrases;
    code_set_type   codes;
  };
  
  class AgentDictionary
  {
  public:
    typedef boost::filesystem::path path_type;
    
    typedef std::vector<AgentPhrase, std::allocator<AgentPhrase> > phrase_set_type;
    
    typedef utils::unordered_map<std::string, phrase_set_type>::type phrase_map_type;
    
  public:
    AgentDictionary() {}
    
    void read(const path_type& path);
    void read(Reader& reader);
    
    const phrase_set_type* find(const std::string& keyword) const
    {
      phrase_map_type::const_iterator iter = phrases.find(keyword);
      return (iter != phrases.end() ? &(iter->second) : 0);
    }
    
    bool empty() const { return phrases.empty(); }
    
  public:
    phrase_map_type phrases;
  };
};

#endif
