// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__EVENT__HPP__
#define __LAUREL__EVENT__HPP__ 1

// events: source, target and event codes.
//
// a slash code A/B stands for both A and B.
// a symmetric event code 057:058 yields source-target events coded by 057 and
// target-source events coded by 058.
//

#include <string>
#include <vector>
#include <iostream>

namespace laurel
{
  struct Participant
  {
    Participant() : code(), root(), text() {}
    Participant(const std::string& __code) : code(__code), root(), text() {}
    Participant(const std::string& __code, const std::string& __root, const std::string& __text)
      : code(__code), root(__root), text(__text) {}
    
    std::string code;
    std::string root;  // root phrase of the actor
    std::string text;  // words of the entity
  };
  
  inline
  bool operator==(const Participant& x, const Participant& y)
  {
    return x.code == y.code && x.root == y.root && x.text == y.text;
  }
  
  inline
  bool operator!=(const Participant& x, const Participant& y)
  {
    return ! (x == y);
  }
  
  typedef std::vector<Participant, std::allocator<Participant> > participant_set_type;
  
  struct Event
  {
    Event() : source(), target(), code() {}
    Event(const Participant& __source, const Participant& __target, const std::string& __code)
      : source(__source), target(__target), code(__code) {}
    
    Participant source;
    Participant target;
    std::string code;
  };
  
  inline
  bool operator==(const Event& x, const Event& y)
  {
    return x.source == y.source && x.target == y.target && x.code == y.code;
  }
  
  inline
  bool operator!=(const Event& x, const Event& y)
  {
    return ! (x == y);
  }
  
  typedef std::vector<Event, std::allocator<Event> > event_set_type;
  
  // source target code
  std::ostream& operator<<(std::ostream& os, const Event& event);
  
  class Assembler
  {
  public:
    Assembler(const bool __require_dyad) : require_dyad(__require_dyad) {}
    
    // append the events of the sources and the targets to events, then remove duplicates.
    // false when either the sources or the targets are empty
    bool operator()(participant_set_type sources,
		    participant_set_type targets,
		    const std::string& code,
		    const bool passive,
		    event_set_type& events) const;
    
    // expand slash codes in place
    static void expand(participant_set_type& participants);
    
  private:
    void cross(const participant_set_type& sources,
	       const participant_set_type& targets,
	       const std::string& code,
	       const bool passive,
	       event_set_type& events) const;
    
  private:
    bool require_dyad;
  };
};

#endif
