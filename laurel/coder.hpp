// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__CODER__HPP__
#define __LAUREL__CODER__HPP__ 1

// sentence and story coding:
//   discards -> date -> normalizer -> clause elision -> resolver -> matcher -> issues
//
// every sentence is coded independently. A story discard drops all the events of the story
// and the remaining sentences are not coded.
//

#include <string>
#include <vector>
#include <iostream>
#include <stdexcept>

#include "token.hpp"
#include "failure.hpp"
#include "config.hpp"
#include "dictionary.hpp"
#include "event.hpp"
#include "normalizer.hpp"
#include "clause.hpp"
#include "resolver.hpp"
#include "matcher.hpp"

namespace laurel
{
  struct Sentence
  {
    Sentence() : id(), date(), source(), text(), parse() {}
    
    std::string id;
    std::string date;    // YYYYMMDD or YYMMDD
    std::string source;
    std::string text;    // uppercased
    std::string parse;   // uppercased
  };
  
  typedef std::vector<Sentence, std::allocator<Sentence> > sentence_set_type;
  
  struct Story
  {
    Story() : id(), sentences() {}
    Story(const std::string& __id) : id(__id), sentences() {}
    
    std::string       id;
    sentence_set_type sentences;
  };
  
  typedef std::vector<Story, std::allocator<Story> > story_set_type;
  
  // result of a sentence
  struct Coding
  {
    typedef DiscardList::discard_type    discard_type;
    typedef IssueList::issue_set_type    issue_set_type;
    
    Coding() : id(), discard(DiscardList::NONE), phrase(), failure(), events(), issues() {}
    
    std::string    id;
    discard_type   discard;
    std::string    phrase;   // discard phrase
    Failure        failure;
    event_set_type events;
    issue_set_type issues;
  };
  
  typedef std::vector<Coding, std::allocator<Coding> > coding_set_type;
  
  struct StoryCoding
  {
    StoryCoding() : id(), discarded(false), codings() {}
    
    std::string     id;
    bool            discarded;
    coding_set_type codings;
  };
  
  struct Summary
  {
    Summary()
      : stories(0), sentences(0), events(0), discards_sentence(0), discards_story(0), empty(0), failures(0) {}
    
    Summary& operator+=(const Summary& x)
    {
      stories           += x.stories;
      sentences         += x.sentences;
      events            += x.events;
      discards_sentence += x.discards_sentence;
      discards_story    += x.discards_story;
      empty             += x.empty;
      failures          += x.failures;
      return *this;
    }
    
    size_t stories;
    size_t sentences;
    size_t events;
    size_t discards_sentence;
    size_t discards_story;
    size_t empty;
    size_t failures;
  };
  
  std::ostream& operator<<(std::ostream& os, const Summary& summary);
  
  class Coder
  {
  private:
    struct proceed
    {
      bool operator()(const Coding&) const { return true; }
    };
    
  public:
    Coder(const Dictionary& __dict, const Config& __config)
      : dict(__dict),
	config(__config),
	elision(__config),
	resolver(__dict.actors, __dict.agents),
	matcher(__dict.verbs, __config) {}
    
  public:
    // code a sentence
    Coding operator()(const Sentence& sentence) const;
    
    // code a story. Throws std::runtime_error on a failure when stop_on_error
    void operator()(const Story& story, StoryCoding& coding, Summary& summary) const
    {
      operator()(story, coding, summary, proceed());
    }
    
    // callback is called with the coding of each sentence, and the story is stopped when it returns false.
    // Returns false when stopped
    template <typename Callback>
    bool operator()(const Story& story, StoryCoding& coding, Summary& summary, Callback callback) const;
    
    // tokens of a sentence after entity resolution, for inspection
    Failure tokenize(const Sentence& sentence, token_set_type& tokens) const;
    
    const Config& configuration() const { return config; }
    
  private:
    const Dictionary& dict;
    Config            config;
    
    Normalizer    normalizer;
    ClauseElision elision;
    Resolver      resolver;
    Matcher       matcher;
  };
  
  template <typename Callback>
  inline
  bool Coder::operator()(const Story& story, StoryCoding& coding, Summary& summary, Callback callback) const
  {
    coding.id = story.id;
    coding.discarded = false;
    coding.codings.clear();
    
    ++ summary.stories;
    
    size_t events = 0;
    bool proceeding = true;
    
    sentence_set_type::const_iterator siter_end = story.sentences.end();
    for (sentence_set_type::const_iterator siter = story.sentences.begin(); siter != siter_end && proceeding; ++ siter) {
      coding.codings.push_back(operator()(*siter));
      
      const Coding& result = coding.codings.back();
      
      if (result.discard == DiscardList::STORY) {
	++ summary.discards_story;
	
	coding.discarded = true;
	for (coding_set_type::iterator citer = coding.codings.begin(); citer != coding.codings.end(); ++ citer)
	  citer->events.clear();
	break;
      } else if (result.discard == DiscardList::SENTENCE)
	++ summary.discards_sentence;
      else if (result.failure.failed()) {
	++ summary.failures;
	
	if (config.stop_on_error)
	  throw std::runtime_error("stop on error: " + result.id + ": " + result.failure.name());
      } else {
	++ summary.sentences;
	events += result.events.size();
	if (result.events.empty())
	  ++ summary.empty;
      }
      
      proceeding = callback(result);
    }
    
    // events of a discarded story are not counted
    if (! coding.discarded)
      summary.events += events;
    
    return proceeding;
  }
};

#endif
