//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/tokenizer.hpp>

#include "issue.hpp"
#include "reader.hpp"
#include "inflection.hpp"

#include "utils/space_separator.hpp"

namespace laurel
{
  typedef std::vector<std::string, std::allocator<std::string> > form_set_type;
  
  // collapse white spaces
  static
  std::string normalize(const std::string& text)
  {
    typedef boost::tokenizer<utils::space_separator> tokenizer_type;
    
    tokenizer_type tokenizer(text);
    return boost::algorithm::join(form_set_type(tokenizer.begin(), tokenizer.end()), " ");
  }
  
  // expand the n:, v: and + shorthands
  static
  void expand(const std::string& form, form_set_type& forms)
  {
    const std::string::size_type pos_plus = form.find('+');
    if (pos_plus != std::string::npos) {
      expand(form.substr(0, pos_plus) + ' ' + form.substr(pos_plus + 1), forms);
      expand(form.substr(0, pos_plus) + '-' + form.substr(pos_plus + 1), forms);
      return;
    }
    
    const std::string::size_type pos_noun = form.find("N:");
    if (pos_noun != std::string::npos) {
      const std::string head = form.substr(0, pos_noun);
      const std::string rest = form.substr(pos_noun + 2);
      const std::string::size_type pos_space = rest.find(' ');
      
      const std::string word = rest.substr(0, pos_space);
      const std::string tail = (pos_space == std::string::npos ? std::string() : rest.substr(pos_space));
      
      expand(head + word + tail, forms);
      expand(head + plural_issue(word) + tail, forms);
      return;
    }
    
    const std::string::size_type pos_verb = form.find("V:");
    if (pos_verb != std::string::npos) {
      const std::string head = form.substr(0, pos_verb);
      const std::string rest = form.substr(pos_verb + 2);
      const std::string::size_type pos_space = rest.find(' ');
      
      const std::string root = rest.substr(0, pos_space);
      const std::string tail = (pos_space == std::string::npos ? std::string() : rest.substr(pos_space));
      
      expand(head + root + tail, forms);
      
      const form_set_type inflected = verb_forms(root);
      for (form_set_type::const_iterator iter = inflected.begin(); iter != inflected.end(); ++ iter)
	expand(head + *iter + tail, forms);
      return;
    }
    
    forms.push_back(form);
  }
  
  void IssueList::read(const path_type& path)
  {
    Reader reader(path);
    read(reader);
  }
  
  void IssueList::read(Reader& reader)
  {
    std::string line;
    while (reader.getline(line)) {
      line = boost::algorithm::trim_copy(line.substr(0, line.find('#')));
      if (line.empty()) continue;
      
      std::string target;
      std::string code;
      bool ignore = false;
      
      if (line[0] == '~') {
	ignore = true;
	code = (line.compare(0, 2, "~~") == 0 ? "~~" : "~");
	target = line.substr(code.size());
      } else {
	const std::string::size_type pos_open = line.find('[');
	const std::string::size_type pos_close = line.find(']', pos_open);
	
	if (pos_open == std::string::npos || pos_close == std::string::npos) {
	  reader.warning() << "issue without a code; line skipped" << std::endl;
	  continue;
	}
	
	code = boost::algorithm::trim_copy(line.substr(pos_open + 1, pos_close - pos_open - 1));
	target = line.substr(0, pos_open);
      }
      
      target = normalize(boost::algorithm::to_upper_copy(target));
      if (target.empty()) {
	reader.warning() << "empty issue phrase" << std::endl;
	continue;
      }
      
      form_set_type forms;
      expand(target, forms);
      
      for (form_set_type::const_iterator fiter = forms.begin(); fiter != forms.end(); ++ fiter)
	phrases.push_back(Phrase(' ' + normalize(*fiter) + ' ', code, ignore));
    }
  }
  
  IssueList::issue_set_type IssueList::code(const std::string& sentence) const
  {
    const std::string text = ' ' + normalize(sentence) + ' ';
    
    issue_set_type issues;
    
    phrase_set_type::const_iterator piter_end = phrases.end();
    for (phrase_set_type::const_iterator piter = phrases.begin(); piter != piter_end; ++ piter) {
      if (text.find(piter->text) == std::string::npos) continue;
      
      if (piter->ignore)
	return issue_set_type();
      
      issue_set_type::iterator iiter = issues.begin();
      for (/**/; iiter != issues.end(); ++ iiter)
	if (iiter->first == piter->code) {
	  ++ iiter->second;
	  break;
	}
      
      if (iiter == issues.end())
	issues.push_back(issue_type(piter->code, 1));
    }
    
    return issues;
  }
  
  std::ostream& operator<<(std::ostream& os, const IssueList::issue_set_type& issues)
  {
    IssueList::issue_set_type::const_iterator iiter_begin = issues.begin();
    IssueList::issue_set_type::const_iterator iiter_end   = issues.end();
    for (IssueList::issue_set_type::const_iterator iiter = iiter_begin; iiter != iiter_end; ++ iiter) {
      if (iiter != iiter_begin)
	os << ';';
      os << iiter->first << ',' << iiter->second;
    }
    return os;
  }
};
