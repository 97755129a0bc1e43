// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__ISSUE__HPP__
#define __LAUREL__ISSUE__HPP__ 1

// issue phrases: PHRASE [CODE]
//
// n:WORD  singular and plural of WORD
// v:WORD  WORD and its regular verb forms
// A+B     "A B" and "A-B"
// ~PHRASE an ignore phrase: no issues are coded for a sentence containing it
//

#include <string>
#include <vector>
#include <utility>
#include <iostream>

#include <boost/filesystem/path.hpp>

namespace laurel
{
  class Reader;
  
  class IssueList
  {
  public:
    typedef boost::filesystem::path path_type;
    
    struct Phrase
    {
      Phrase() : text(), code(), ignore(false) {}
      Phrase(const std::string& __text, const std::string& __code, const bool __ignore)
	: text(__text), code(__code), ignore(__ignore) {}
      
      std::string text;  // uppercased, padded by blanks
      std::string code;
      bool        ignore;
    };
    
    typedef std::vector<Phrase, std::allocator<Phrase> > phrase_set_type;
    
    typedef std::pair<std::string, int> issue_type;
    typedef std::vector<issue_type, std::allocator<issue_type> > issue_set_type;
    
  public:
    IssueList() {}
    
    void read(const path_type& path);
    void read(Reader& reader);
    
    // codes with the number of phrases found, in the order of the first phrase found.
    // empty when an ignore phrase is found.
    issue_set_type code(const std::string& text) const;
    
    bool empty() const { return phrases.empty(); }
    
  public:
    phrase_set_type phrases;
  };
  
  // CODE,count;CODE,count
  std::ostream& operator<<(std::ostream& os, const IssueList::issue_set_type& issues);
};

#endif
