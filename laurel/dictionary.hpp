// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__DICTIONARY__HPP__
#define __LAUREL__DICTIONARY__HPP__ 1

#include <vector>

#include <boost/filesystem/path.hpp>

#include "verb.hpp"
#include "actor.hpp"
#include "discard.hpp"
#include "issue.hpp"

namespace laurel
{
  // read-only tables shared by all the sentences
  struct Dictionary
  {
    typedef boost::filesystem::path path_type;
    typedef std::vector<path_type, std::allocator<path_type> > path_set_type;
    
    Dictionary() {}
    
    // verbs, actors and agents are required. Discards and issues are optional: empty paths are skipped
    void read(const path_type& verbfile,
	      const path_set_type& actorfiles,
	      const path_type& agentfile,
	      const path_type& discardfile,
	      const path_type& issuefile);
    
    void clear()
    {
      verbs.clear();
      actors = ActorDictionary();
      agents = AgentDictionary();
      discards = DiscardList();
      issues = IssueList();
    }
    
    VerbDictionary  verbs;
    ActorDictionary actors;
    AgentDictionary agents;
    DiscardList     discards;
    IssueList       issues;
  };
};

#endif
