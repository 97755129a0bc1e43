// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__DISCARD__HPP__
#define __LAUREL__DISCARD__HPP__ 1

// discard phrases: a sentence whose text contains one of the phrases is not coded.
// A phrase prefixed by '+' discards the whole story. A trailing '_' requires the phrase
// to be followed by a blank, a punctuation or the end of the text; otherwise the phrase is a stem.
//

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

namespace laurel
{
  class Reader;
  
  class DiscardList
  {
  public:
    typedef boost::filesystem::path path_type;
    
    struct Phrase
    {
      Phrase() : text(), story(false), terminal(false) {}
      
      std::string text;  // uppercased, prefixed by a blank
      bool story;
      bool terminal;
    };
    
    typedef std::vector<Phrase, std::allocator<Phrase> > phrase_set_type;
    
    typedef enum {
      NONE = 0,
      SENTENCE,
      STORY,
    } discard_type;
    
    struct Result
    {
      Result() : type(NONE), phrase() {}
      Result(const discard_type& __type, const std::string& __phrase) : type(__type), phrase(__phrase) {}
      
      discard_type type;
      std::string  phrase;
    };
    
  public:
    DiscardList() {}
    
    void read(const path_type& path);
    void read(Reader& reader);
    
    // story discards take precedence over sentence discards. text should be uppercased
    Result check(const std::string& text) const;
    
    bool empty() const { return phrases.empty(); }
    
  public:
    phrase_set_type phrases;
  };
};

#endif
