// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__VERB__HPP__
#define __LAUREL__VERB__HPP__ 1

// verb dictionary
//
// --- ATTACK [190]          a block: the first verb is the primary verb with the default code
// ATTACK                    regular forms ATTACKS, ATTACKED, ATTACKING are generated
// ASSAULT [191]             synonym with its own code
// BEAT {BEATS BEAT BEATEN}  irregular forms
// +CARRY_OUT [192]          multi-word verb, + marks the verb
// - $ * + [193]             pattern: upper * lower
// &WEAPON                   synonym set, members are listed by +
// +GUN
//

#include <string>
#include <vector>
#include <iostream>

#include <boost/filesystem/path.hpp>

#include <utils/unordered_map.hpp>

#include "phrase.hpp"

namespace laurel
{
  class Reader;
  
  struct PatternAtom
  {
    typedef enum {
      LITERAL,
      SYNSET,
      SOURCE,    // $
      TARGET,    // +
      SKIP,      // ^
      COMPOUND,  // %
    } kind_type;
    
    PatternAtom() : kind(LITERAL), word(), connector(' ') {}
    PatternAtom(const kind_type& __kind, const std::string& __word, const char __connector)
      : kind(__kind), word(__word), connector(__connector) {}
    
    bool is_control() const { return kind != LITERAL && kind != SYNSET; }
    
    kind_type   kind;
    std::string word;
    
    // connector preceding this atom in matching order: ' ' allows intervening words, '_' requires adjacency
    char connector;
  };
  
  typedef std::vector<PatternAtom, std::allocator<PatternAtom> > pattern_type;
  
  struct VerbPattern
  {
    VerbPattern() : upper(), lower(), code() {}
    
    pattern_type upper;  // ordered from the verb backward
    pattern_type lower;  // ordered from the verb forward
    std::string  code;
  };
  
  struct MultiWord
  {
    MultiWord() : forward(true), words(), code(), verb() {}
    
    bool        forward;  // true when words follow the verb
    phrase_type words;    // ordered away from the verb
    std::string code;
    std::string verb;     // primary entry holding the patterns
  };
  
  struct VerbEntry
  {
    typedef std::vector<VerbPattern, std::allocator<VerbPattern> > pattern_set_type;
    typedef std::vector<MultiWord, std::allocator<MultiWord> >     multiword_set_type;
    
    VerbEntry() : primary(true), code(), redirect(), multiwords(), patterns() {}
    
    bool               primary;
    std::string        code;        // default code
    std::string        redirect;    // key of the primary entry when not primary
    multiword_set_type multiwords;
    pattern_set_type   patterns;
  };
  
  class VerbDictionary
  {
  public:
    typedef boost::filesystem::path path_type;
    
    typedef std::vector<phrase_type, std::allocator<phrase_type> > synset_type;
    
    typedef utils::unordered_map<std::string, VerbEntry>::type   verb_map_type;
    typedef utils::unordered_map<std::string, synset_type>::type synset_map_type;
    
  public:
    VerbDictionary() {}
    explicit VerbDictionary(const path_type& path) { read(path); }
    
  public:
    void read(const path_type& path);
    void read(Reader& reader);
    
    const VerbEntry* find(const std::string& verb) const
    {
      verb_map_type::const_iterator iter = verbs.find(verb);
      return (iter != verbs.end() ? &(iter->second) : 0);
    }
    
    // primary entry holding the patterns of an entry
    const VerbEntry* primary(const VerbEntry& entry) const
    {
      return (entry.primary ? &entry : find(entry.redirect));
    }
    
    const synset_type* synset(const std::string& name) const
    {
      synset_map_type::const_iterator iter = synsets.find(name);
      return (iter != synsets.end() ? &(iter->second) : 0);
    }
    
    bool empty() const { return verbs.empty(); }
    size_t size() const { return verbs.size(); }
    
    void clear()
    {
      verbs.clear();
      synsets.clear();
    }
    
  public:
    verb_map_type   verbs;
    synset_map_type synsets;
  };
  
  std::ostream& operator<<(std::ostream& os, const pattern_type& pattern);
};

#endif
