//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#define BOOST_SPIRIT_THREADSAFE
#define PHOENIX_THREADSAFE

#include <boost/spirit/include/qi.hpp>

#include <boost/fusion/include/adapt_struct.hpp>

#include <boost/thread.hpp>

#include "treebank.hpp"

BOOST_FUSION_ADAPT_STRUCT(
			  laurel::Treebank,
			  (laurel::Treebank::cat_type, cat)
			  (laurel::Treebank::antecedents_type, antecedents)
			  )

namespace laurel
{
  template <typename Iterator>
  struct treebank_grammar : boost::spirit::qi::grammar<Iterator, Treebank(), boost::spirit::standard::space_type>
  {
    treebank_grammar() : treebank_grammar::base_type(root)
    {
      namespace qi = boost::spirit::qi;
      namespace standard = boost::spirit::standard;
      
      cat %= qi::lexeme[+(standard::char_ - standard::space - '(' - ')')];
      treebank %= qi::hold['(' >> cat >> +treebank >> ')'] | cat;
      root %= qi::hold['(' >> cat >> +treebank >> ')'] | qi::hold['(' >> qi::attr("ROOT") >> +treebank >> ')'];
    }
    
    boost::spirit::qi::rule<Iterator, Treebank::cat_type(), boost::spirit::standard::space_type> cat;
    boost::spirit::qi::rule<Iterator, Treebank(), boost::spirit::standard::space_type>           treebank;
    boost::spirit::qi::rule<Iterator, Treebank(), boost::spirit::standard::space_type>           root;
  };
  
  namespace treebank_impl
  {
    typedef treebank_grammar<std::string::const_iterator> grammar_type;
    
    static boost::thread_specific_ptr<grammar_type> __grammar;
    
    static grammar_type& instance()
    {
      if (! __grammar.get())
	__grammar.reset(new grammar_type());
      
      return *__grammar;
    }
  };
  
  bool Treebank::assign(const std::string& line)
  {
    namespace qi = boost::spirit::qi;
    namespace standard = boost::spirit::standard;
    
    clear();
    
    std::string::const_iterator iter = line.begin();
    std::string::const_iterator end = line.end();
    
    const bool result = qi::phrase_parse(iter, end, treebank_impl::instance(), standard::space, *this);
    
    if (! result || iter != end) {
      clear();
      return false;
    }
    
    if (cat != "ROOT") {
      // a tree without the ROOT node
      Treebank child;
      child.cat.swap(cat);
      child.antecedents.swap(antecedents);
      
      cat = "ROOT";
      antecedents.push_back(child);
    }
    
    return true;
  }
  
  std::ostream& operator<<(std::ostream& os, const Treebank& treebank)
  {
    if (treebank.terminal())
      os << treebank.cat;
    else {
      os << '(' << treebank.cat;
      Treebank::antecedents_type::const_iterator aiter_end = treebank.antecedents.end();
      for (Treebank::antecedents_type::const_iterator aiter = treebank.antecedents.begin(); aiter != aiter_end; ++ aiter)
	os << ' ' << *aiter;
      os << ')';
    }
    return os;
  }
};
