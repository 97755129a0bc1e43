//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <stdexcept>

#include "dictionary.hpp"

namespace laurel
{
  void Dictionary::read(const path_type& verbfile,
			const path_set_type& actorfiles,
			const path_type& agentfile,
			const path_type& discardfile,
			const path_type& issuefile)
  {
    if (verbfile.empty())
      throw std::runtime_error("no verb dictionary");
    if (actorfiles.empty())
      throw std::runtime_error("no actor dictionary");
    if (agentfile.empty())
      throw std::runtime_error("no agent dictionary");
    
    clear();
    
    verbs.read(verbfile);
    
    path_set_type::const_iterator aiter_end = actorfiles.end();
    for (path_set_type::const_iterator aiter = actorfiles.begin(); aiter != aiter_end; ++ aiter)
      actors.read(*aiter);
    
    agents.read(agentfile);
    
    if (! discardfile.empty())
      discards.read(discardfile);
    if (! issuefile.empty())
      issues.read(issuefile);
  }
};
