//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <algorithm>

#include <boost/algorithm/string/predicate.hpp>

#include "normalizer.hpp"

namespace laurel
{
  namespace normalizer_impl
  {
    typedef std::vector<const Treebank*, std::allocator<const Treebank*> > node_set_type;
    
    inline
    bool prefix(const Treebank& node, const char* label)
    {
      return ! node.terminal() && boost::algorithm::starts_with(node.cat, label);
    }
    
    // true when a non-terminal below node (or node itself, when self is true) starts with label
    bool has_prefix(const Treebank& node, const char* label, const bool self)
    {
      if (self && prefix(node, label))
	return true;
      
      Treebank::antecedents_type::const_iterator aiter_end = node.antecedents.end();
      for (Treebank::antecedents_type::const_iterator aiter = node.antecedents.begin(); aiter != aiter_end; ++ aiter)
	if (has_prefix(*aiter, label, true))
	  return true;
      return false;
    }
    
    int count_prefix(const Treebank& node, const char* label)
    {
      int count = prefix(node, label);
      
      Treebank::antecedents_type::const_iterator aiter_end = node.antecedents.end();
      for (Treebank::antecedents_type::const_iterator aiter = node.antecedents.begin(); aiter != aiter_end; ++ aiter)
	count += count_prefix(*aiter, label);
      return count;
    }
    
    // non-terminals below node in pre-order
    void preorder(const Treebank& node, node_set_type& nodes)
    {
      Treebank::antecedents_type::const_iterator aiter_end = node.antecedents.end();
      for (Treebank::antecedents_type::const_iterator aiter = node.antecedents.begin(); aiter != aiter_end; ++ aiter)
	if (! aiter->terminal()) {
	  nodes.push_back(&(*aiter));
	  preorder(*aiter, nodes);
	}
    }
    
    const Treebank* parent(const Treebank& node, const Treebank* child)
    {
      Treebank::antecedents_type::const_iterator aiter_end = node.antecedents.end();
      for (Treebank::antecedents_type::const_iterator aiter = node.antecedents.begin(); aiter != aiter_end; ++ aiter) {
	if (&(*aiter) == child)
	  return &node;
	
	const Treebank* found = parent(*aiter, child);
	if (found)
	  return found;
      }
      return 0;
    }
    
    // a coordination marks either a compound noun phrase, NEC, or a coordinated clause, CCP
    void mark_compounds(Treebank& node)
    {
      Treebank::antecedents_type::iterator aiter_end = node.antecedents.end();
      for (Treebank::antecedents_type::iterator aiter = node.antecedents.begin(); aiter != aiter_end; ++ aiter) {
	if (aiter->cat == "CC" && ! aiter->terminal()) {
	  if (has_prefix(node, "VP", true) || has_prefix(node, "S", true))
	    aiter->cat = "CCP";
	  else if (count_prefix(node, "CC") > 1)
	    aiter->cat = "CCP";
	  else if (boost::algorithm::starts_with(node.cat, "NP") && count_prefix(node, "N") >= 3)
	    node.cat = "NEC";
	}
	
	mark_compounds(*aiter);
      }
    }
    
    void collect_words(const Treebank& node, phrase_type& words)
    {
      if (node.terminal())
	words.push_back(node.cat);
      else {
	Treebank::antecedents_type::const_iterator aiter_end = node.antecedents.end();
	for (Treebank::antecedents_type::const_iterator aiter = node.antecedents.begin(); aiter != aiter_end; ++ aiter)
	  collect_words(*aiter, words);
      }
    }
    
    // subordinate clauses are reduced to (SBR words)
    void reduce_sbar(Treebank& node)
    {
      Treebank::antecedents_type::iterator aiter_end = node.antecedents.end();
      for (Treebank::antecedents_type::iterator aiter = node.antecedents.begin(); aiter != aiter_end; ++ aiter) {
	if (aiter->terminal()) continue;
	
	if (aiter->cat == "SBAR") {
	  phrase_type words;
	  collect_words(*aiter, words);
	  
	  aiter->cat = "SBR";
	  aiter->antecedents.clear();
	  for (phrase_type::const_iterator witer = words.begin(); witer != words.end(); ++ witer)
	    aiter->antecedents.push_back(Treebank(*witer));
	} else
	  reduce_sbar(*aiter);
      }
    }
    
    struct Linearizer
    {
      Linearizer(token_set_type& __tokens)
	: tokens(__tokens), npindex(1), vpindex(1), ncindex(1), failure() {}
      
      static Token close() { return Token(Token::CLOSE, std::string()); }
      
      // copy with the markup. The closing tokens are labeled later
      void copy(const Treebank& node, token_set_type& output)
      {
	if (node.terminal()) {
	  output.push_back(Token::word(node.cat));
	  return;
	}
	
	output.push_back(node.cat == "NEC" ? Token::compound() : Token::open(node.cat));
	Treebank::antecedents_type::const_iterator aiter_end = node.antecedents.end();
	for (Treebank::antecedents_type::const_iterator aiter = node.antecedents.begin(); aiter != aiter_end; ++ aiter)
	  copy(*aiter, output);
	output.push_back(close());
      }
      
      // words without the markup, but compounds are copied with the markup
      void words(const Treebank& node, token_set_type& output, const Treebank* skip=0)
      {
	if (&node == skip)
	  return;
	else if (node.terminal())
	  output.push_back(Token::word(node.cat));
	else if (node.cat == "NEC")
	  copy(node, output);
	else {
	  Treebank::antecedents_type::const_iterator aiter_end = node.antecedents.end();
	  for (Treebank::antecedents_type::const_iterator aiter = node.antecedents.begin(); aiter != aiter_end; ++ aiter)
	    words(*aiter, output, skip);
	}
      }
      
      bool entity(const token_set_type& content)
      {
	token_set_type::const_iterator citer_end = content.end();
	token_set_type::const_iterator citer = content.begin();
	for (/**/; citer != citer_end; ++ citer)
	  if (citer->is_word()) break;
	
	if (citer == citer_end) {
	  failure = Failure(Failure::EMPTY_NPLIST, "empty noun phrase");
	  return false;
	}
	
	tokens.push_back(Token::entity());
	tokens.insert(tokens.end(), content.begin(), content.end());
	tokens.push_back(close());
	return true;
      }
      
      // (NP (NP ...) (PP (IN ...) (NP ...))) is collapsed into a single entity
      bool preposition(const Treebank& np, const Treebank& pp, token_set_type& content)
      {
	const Treebank* enclosing = parent(np, &pp);
	if (! enclosing || enclosing->cat != "NP" || enclosing->antecedents.empty())
	  return false;
	
	const Treebank& head = enclosing->antecedents.front();
	if (prefix(head, "NP"))
	  words(head, content);
	else if (prefix(head, "NEC"))
	  copy(head, content);
	else
	  return false;
	
	node_set_type nodes;
	for (size_t i = 1; i != enclosing->antecedents.size(); ++ i)
	  if (! enclosing->antecedents[i].terminal()) {
	    nodes.push_back(&enclosing->antecedents[i]);
	    preorder(enclosing->antecedents[i], nodes);
	  }
	
	node_set_type::const_iterator niter = nodes.begin();
	for (/**/; niter != nodes.end(); ++ niter)
	  if ((*niter)->cat == "IN") break;
	if (niter == nodes.end())
	  return false;
	
	words(**niter, content);
	
	for (++ niter; niter != nodes.end(); ++ niter)
	  if ((*niter)->cat == "NP" || (*niter)->cat == "NEC") break;
	if (niter == nodes.end())
	  return false;
	
	const Treebank& object = **niter;
	
	// nested prepositions
	if (has_prefix(object, "PP", true))
	  return false;
	
	if (object.cat == "NEC")
	  copy(object, content);
	else
	  words(object, content);
	
	// transfer a subordinate clause following the object
	node_set_type nodes_np;
	preorder(np, nodes_np);
	
	node_set_type::const_iterator oiter = std::find(nodes_np.begin(), nodes_np.end(), &object);
	if (oiter != nodes_np.end()) {
	  node_set_type nodes_object;
	  preorder(object, nodes_object);
	  
	  for (oiter += 1 + nodes_object.size(); oiter != nodes_np.end(); ++ oiter)
	    if ((*oiter)->cat == "SBR") {
	      words(**oiter, content);
	      break;
	    }
	}
	
	return true;
      }
      
      // compound noun phrase: each head is an entity sharing the leading adjectives
      void compound(const Treebank& nec)
      {
	tokens.push_back(Token::compound(ncindex ++));
	
	token_set_type adjectives;
	{
	  node_set_type nodes;
	  preorder(nec, nodes);
	  
	  for (node_set_type::const_iterator niter = nodes.begin(); niter != nodes.end(); ++ niter) {
	    if (prefix(**niter, "NP") || prefix(**niter, "NN"))
	      break;
	    if (prefix(**niter, "JJ"))
	      words(**niter, adjectives);
	  }
	}
	
	heads(nec, adjectives);
	
	tokens.push_back(close());
      }
      
      void heads(const Treebank& node, const token_set_type& adjectives)
      {
	Treebank::antecedents_type::const_iterator aiter_end = node.antecedents.end();
	for (Treebank::antecedents_type::const_iterator aiter = node.antecedents.begin(); aiter != aiter_end; ++ aiter) {
	  if (aiter->terminal()) continue;
	  
	  if (prefix(*aiter, "NP") || prefix(*aiter, "NN")) {
	    token_set_type content(adjectives);
	    words(*aiter, content);
	    if (! entity(content))
	      return;
	  } else
	    heads(*aiter, adjectives);
	}
      }
      
      void noun_phrase(Treebank& np)
      {
	reduce_sbar(np);
	
	node_set_type nodes;
	preorder(np, nodes);
	
	const Treebank* pos = 0;
	const Treebank* pp = 0;
	for (node_set_type::const_iterator niter = nodes.begin(); niter != nodes.end(); ++ niter) {
	  if (! pos && prefix(**niter, "POS"))
	    pos = *niter;
	  if (! pp && prefix(**niter, "PP"))
	    pp = *niter;
	}
	
	token_set_type content;
	bool converted = false;
	
	if (pos) {
	  words(np, content, pos);
	  converted = true;
	} else if (pp)
	  converted = preposition(np, *pp, content);
	else if (! has_prefix(np, "NP", false) && ! has_prefix(np, "NEC", false)) {
	  words(np, content);
	  converted = true;
	}
	
	if (converted) {
	  entity(content);
	  return;
	}
	
	tokens.push_back(Token::open("NP", npindex ++));
	antecedents(np);
	tokens.push_back(close());
      }
      
      void antecedents(Treebank& node)
      {
	Treebank::antecedents_type::iterator aiter_end = node.antecedents.end();
	for (Treebank::antecedents_type::iterator aiter = node.antecedents.begin(); aiter != aiter_end && failure.ok(); ++ aiter)
	  operator()(*aiter);
      }
      
      void operator()(Treebank& node)
      {
	if (node.terminal())
	  tokens.push_back(Token::word(node.cat));
	else if (node.cat == "NP")
	  noun_phrase(node);
	else if (node.cat == "NEC")
	  compound(node);
	else if (node.cat == "VP") {
	  tokens.push_back(Token::open("VP", vpindex ++));
	  antecedents(node);
	  tokens.push_back(close());
	} else {
	  tokens.push_back(Token::open(node.cat));
	  antecedents(node);
	  tokens.push_back(close());
	}
      }
      
      token_set_type& tokens;
      
      int npindex;
      int vpindex;
      int ncindex;
      
      Failure failure;
    };
    
    // label the closing tokens by unwinding the stack of the opening tokens
    Failure label_closing(token_set_type& tokens)
    {
      std::vector<const Token*, std::allocator<const Token*> > stack;
      
      token_set_type::iterator titer_end = tokens.end();
      for (token_set_type::iterator titer = tokens.begin(); titer != titer_end; ++ titer) {
	if (titer->is_opening())
	  stack.push_back(&(*titer));
	else if (titer->kind == Token::CLOSE && titer->label.empty()) {
	  if (stack.empty())
	    return Failure(Failure::BAD_FINAL_PARSE, "unmatched closing bracket");
	  
	  const Token& open = *stack.back();
	  switch (open.kind) {
	  case Token::ENTITY:   *titer = Token::entity_end(); break;
	  case Token::COMPOUND: *titer = Token::compound_end(open.index); break;
	  default:              *titer = Token::close(open.label, open.index); break;
	  }
	  
	  stack.pop_back();
	}
      }
      
      if (! stack.empty())
	return Failure(Failure::BAD_FINAL_PARSE, "unclosed bracket");
      
      return Failure();
    }
  };
  
  Failure Normalizer::operator()(const std::string& parse, token_set_type& tokens) const
  {
    tokens.clear();
    
    if (std::count(parse.begin(), parse.end(), '(') != std::count(parse.begin(), parse.end(), ')'))
      return Failure(Failure::BAD_INPUT_PARSE, "unbalanced brackets");
    
    Treebank treebank;
    if (! treebank.assign(parse))
      return Failure(Failure::BAD_INPUT_PARSE, "invalid tree");
    
    return operator()(treebank, tokens);
  }
  
  Failure Normalizer::operator()(const Treebank& __treebank, token_set_type& tokens) const
  {
    using namespace normalizer_impl;
    
    tokens.clear();
    
    Treebank treebank(__treebank);
    
    mark_compounds(treebank);
    
    Linearizer linearizer(tokens);
    linearizer(treebank);
    
    if (linearizer.failure.failed()) {
      tokens.clear();
      return linearizer.failure;
    }
    
    const Failure failure = label_closing(tokens);
    if (failure.failed()) {
      tokens.clear();
      return failure;
    }
    
    // dateline: (ROOT (NE (NEC
    std::vector<const Token*, std::allocator<const Token*> > openings;
    for (token_set_type::const_iterator titer = tokens.begin(); titer != tokens.end() && openings.size() < 3; ++ titer)
      if (titer->is_opening())
	openings.push_back(&(*titer));
    
    if (openings.size() == 3 && openings[0]->is_open("ROOT") && openings[1]->is_entity() && openings[2]->is_compound()) {
      tokens.clear();
      return Failure(Failure::DATELINE, "dateline pattern");
    }
    
    if (! balanced(tokens)) {
      tokens.clear();
      return Failure(Failure::BAD_FINAL_PARSE, "unbalanced tokens");
    }
    
    return Failure();
  }
};
