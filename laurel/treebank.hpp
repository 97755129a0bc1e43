// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__TREEBANK__HPP__
#define __LAUREL__TREEBANK__HPP__ 1

// penn-treebank style bracketed tree, (ROOT (S (NP (NNP FRANCE)) (VP (VBD ATTACKED) ...)))
// A terminal is a node without antecedents. An unlabeled root is labeled ROOT.
//

#include <string>
#include <vector>
#include <iostream>

namespace laurel
{
  struct Treebank
  {
    typedef std::string cat_type;
    typedef std::vector<Treebank, std::allocator<Treebank> > antecedents_type;
    
    Treebank() : cat(), antecedents() {}
    Treebank(const cat_type& __cat) : cat(__cat), antecedents() {}
    
    // false when the string is not a well-formed tree
    bool assign(const std::string& line);
    
    bool terminal() const { return antecedents.empty(); }
    bool preterminal() const { return antecedents.size() == 1 && antecedents.front().terminal(); }
    
    void clear()
    {
      cat.clear();
      antecedents.clear();
    }
    
    cat_type         cat;
    antecedents_type antecedents;
  };
  
  std::ostream& operator<<(std::ostream& os, const Treebank& treebank);
};

#endif
