//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <algorithm>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include "event.hpp"
#include "token.hpp"

namespace laurel
{
  std::ostream& operator<<(std::ostream& os, const Event& event)
  {
    os << event.source.code << ' ' << event.target.code << ' ' << event.code;
    return os;
  }
  
  void Assembler::expand(participant_set_type& participants)
  {
    participant_set_type expanded;
    
    participant_set_type::const_iterator piter_end = participants.end();
    for (participant_set_type::const_iterator piter = participants.begin(); piter != piter_end; ++ piter) {
      if (piter->code.find('/') == std::string::npos) {
	expanded.push_back(*piter);
	continue;
      }
      
      std::vector<std::string, std::allocator<std::string> > codes;
      boost::algorithm::split(codes, piter->code, boost::algorithm::is_any_of("/"));
      
      std::vector<std::string, std::allocator<std::string> >::const_iterator citer_end = codes.end();
      for (std::vector<std::string, std::allocator<std::string> >::const_iterator citer = codes.begin(); citer != citer_end; ++ citer)
	expanded.push_back(Participant(*citer, piter->root, piter->text));
    }
    
    participants.swap(expanded);
  }
  
  void Assembler::cross(const participant_set_type& sources,
			const participant_set_type& targets,
			const std::string& code,
			const bool passive,
			event_set_type& events) const
  {
    participant_set_type::const_iterator siter_end = sources.end();
    for (participant_set_type::const_iterator siter = sources.begin(); siter != siter_end; ++ siter) {
      participant_set_type::const_iterator titer_end = targets.end();
      for (participant_set_type::const_iterator titer = targets.begin(); titer != titer_end; ++ titer) {
	// self reference
	if (siter->code == titer->code) continue;
	
	if (passive)
	  events.push_back(Event(*titer, *siter, code));
	else
	  events.push_back(Event(*siter, *titer, code));
      }
    }
  }
  
  bool Assembler::operator()(participant_set_type sources,
			     participant_set_type targets,
			     const std::string& code,
			     const bool passive,
			     event_set_type& events) const
  {
    expand(sources);
    expand(targets);
    
    if (sources.empty() || targets.empty())
      return false;
    
    const size_t first = events.size();
    
    const std::string::size_type pos = code.find(':');
    if (pos != std::string::npos) {
      // an unresolved side is coded by the other side
      if (sources.front().code == Token::unresolved() || targets.front().code == Token::unresolved()) {
	if (targets.front().code == Token::unresolved())
	  targets = sources;
	else
	  sources = targets;
      }
      
      cross(sources, targets, code.substr(0, pos), passive, events);
      cross(targets, sources, code.substr(pos + 1), passive, events);
    } else
      cross(sources, targets, code, passive, events);
    
    if (require_dyad) {
      event_set_type::iterator iter = events.begin() + first;
      while (iter != events.end()) {
	if (iter->source.code == Token::unresolved() || iter->target.code == Token::unresolved())
	  iter = events.erase(iter);
	else
	  ++ iter;
      }
    }
    
    // duplicates, keeping the first
    event_set_type::iterator iter = events.begin() + first;
    while (iter != events.end()) {
      if (std::find(events.begin(), iter, *iter) != iter)
	iter = events.erase(iter);
      else
	++ iter;
    }
    
    return true;
  }
};
