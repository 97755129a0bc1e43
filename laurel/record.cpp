//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <stdexcept>
#include <algorithm>

#include <boost/property_tree/xml_parser.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/join.hpp>

#include "record.hpp"

#include "utils/compress_stream.hpp"
#include "utils/unordered_map.hpp"

namespace laurel
{
  std::string story_id(const std::string& sentence_id)
  {
    const std::string::size_type pos = sentence_id.find_last_of("-_");
    return (pos == std::string::npos ? sentence_id : sentence_id.substr(0, pos));
  }
  
  bool SentenceReader::sentence(const ptree_type& node, Sentence& sentence) const
  {
    sentence.id     = node.get<std::string>("<xmlattr>.id", std::string());
    sentence.date   = node.get<std::string>("<xmlattr>.date", std::string());
    sentence.source = node.get<std::string>("<xmlattr>.source", std::string());
    
    if (sentence.id.empty())
      throw std::runtime_error("sentence without its id");
    
    const boost::optional<std::string> text  = node.get_optional<std::string>("Text");
    const boost::optional<std::string> parse = node.get_optional<std::string>("Parse");
    
    if (! parse || boost::algorithm::trim_copy(*parse).empty()) {
      if (debug)
	std::cerr << sentence.id << " has no parse" << std::endl;
      return false;
    }
    
    sentence.text  = upper(text ? boost::algorithm::trim_copy(*text) : std::string());
    sentence.parse = upper(boost::algorithm::trim_copy(*parse));
    
    return true;
  }
  
  void SentenceReader::read(const path_type& path, story_set_type& stories) const
  {
    utils::compress_istream is(path, 1024 * 1024);
    read(is, stories);
  }
  
  void SentenceReader::read(std::istream& is, story_set_type& stories) const
  {
    typedef utils::unordered_map<std::string, size_t>::type index_map_type;
    
    ptree_type tree;
    boost::property_tree::read_xml(is, tree, boost::property_tree::xml_parser::trim_whitespace);
    
    index_map_type indices;
    for (size_t i = 0; i != stories.size(); ++ i)
      indices[stories[i].id] = i;
    
    const ptree_type& sentences = tree.get_child("Sentences");
    
    ptree_type::const_iterator iter_end = sentences.end();
    for (ptree_type::const_iterator iter = sentences.begin(); iter != iter_end; ++ iter) {
      if (iter->first != "Sentence") continue;
      
      Sentence sentence;
      if (! SentenceReader::sentence(iter->second, sentence)) continue;
      
      const std::string id = story_id(sentence.id);
      
      std::pair<index_map_type::iterator, bool> result = indices.insert(std::make_pair(id, stories.size()));
      if (result.second)
	stories.push_back(Story(id));
      
      stories[result.first->second].sentences.push_back(sentence);
    }
  }
  
  namespace record_impl
  {
    struct Record
    {
      Record() : event(), ids(), issues() {}
      Record(const Event& __event) : event(__event), ids(), issues() {}
      
      Event                     event;
      std::vector<std::string>  ids;
      IssueList::issue_set_type issues;
    };
    
    typedef std::vector<Record, std::allocator<Record> > record_set_type;
    
    void merge(IssueList::issue_set_type& issues, const IssueList::issue_set_type& x)
    {
      IssueList::issue_set_type::const_iterator xiter_end = x.end();
      for (IssueList::issue_set_type::const_iterator xiter = x.begin(); xiter != xiter_end; ++ xiter) {
	IssueList::issue_set_type::iterator iter = issues.begin();
	for (/**/; iter != issues.end(); ++ iter)
	  if (iter->first == xiter->first) break;
	
	if (iter == issues.end())
	  issues.push_back(*xiter);
	else
	  iter->second += xiter->second;
      }
    }
  };
  
  void EventWriter::operator()(const Story& story, const StoryCoding& coding)
  {
    using namespace record_impl;
    
    if (coding.discarded || story.sentences.empty()) return;
    
    record_set_type records;
    
    coding_set_type::const_iterator citer_end = coding.codings.end();
    for (coding_set_type::const_iterator citer = coding.codings.begin(); citer != citer_end; ++ citer) {
      event_set_type::const_iterator eiter_end = citer->events.end();
      for (event_set_type::const_iterator eiter = citer->events.begin(); eiter != eiter_end; ++ eiter) {
	record_set_type::iterator riter = records.begin();
	for (/**/; riter != records.end(); ++ riter)
	  if (riter->event == *eiter) break;
	
	if (riter == records.end()) {
	  records.push_back(Record(*eiter));
	  riter = records.end() - 1;
	}
	
	if (std::find(riter->ids.begin(), riter->ids.end(), citer->id) == riter->ids.end()) {
	  riter->ids.push_back(citer->id);
	  merge(riter->issues, citer->issues);
	}
      }
    }
    
    const Sentence& first = story.sentences.front();
    
    record_set_type::const_iterator riter_end = records.end();
    for (record_set_type::const_iterator riter = records.begin(); riter != riter_end; ++ riter) {
      os << first.date
	 << '\t' << riter->event.source.code
	 << '\t' << riter->event.target.code
	 << '\t' << riter->event.code
	 << '\t' << boost::algorithm::join(riter->ids, ";")
	 << '\t' << first.source;
      
      if (issues)
	os << '\t' << riter->issues;
      if (config.write_actor_root)
	os << '\t' << riter->event.source.root << '\t' << riter->event.target.root;
      if (config.write_actor_text)
	os << '\t' << riter->event.source.text << '\t' << riter->event.target.text;
      
      os << '\n';
    }
  }
};
