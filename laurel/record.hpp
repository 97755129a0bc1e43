// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__RECORD__HPP__
#define __LAUREL__RECORD__HPP__ 1

// sentence records and event records
//
// input:
// <Sentences>
//  <Sentence date="20150101" id="AFP0001-1" source="AFP">
//   <Text>France attacked Germany.</Text>
//   <Parse>(ROOT (S (NP (NNP France)) (VP (VBD attacked) (NP (NNP Germany))) (. .)))</Parse>
//  </Sentence>
// </Sentences>
//
// output, tab separated:
// date source target code sentence-ids source-label [issues] [source-root target-root] [source-text target-text]
//

#include <string>
#include <iostream>

#include <boost/filesystem/path.hpp>
#include <boost/property_tree/ptree.hpp>

#include "coder.hpp"
#include "config.hpp"
#include "upper.hpp"

namespace laurel
{
  // story identifier of a sentence identifier: the part before the last '-' or '_'
  std::string story_id(const std::string& sentence_id);
  
  class SentenceReader
  {
  public:
    typedef boost::filesystem::path path_type;
    typedef boost::property_tree::ptree ptree_type;
    
  public:
    SentenceReader(const int __debug=0) : upper(), debug(__debug) {}
    
    // sentences grouped into stories, appended to stories
    void read(const path_type& path, story_set_type& stories) const;
    void read(std::istream& is, story_set_type& stories) const;
    
    // a <Sentence> element. false when it has no parse
    bool sentence(const ptree_type& node, Sentence& sentence) const;
    
  private:
    Upper upper;
    int   debug;
  };
  
  class EventWriter
  {
  public:
    EventWriter(std::ostream& __os, const Config& __config, const bool __issues)
      : os(__os), config(__config), issues(__issues) {}
    
    // events of a story, merged over its sentences. Nothing is written for a discarded story
    void operator()(const Story& story, const StoryCoding& coding);
    
  private:
    std::ostream& os;
    Config        config;
    bool          issues;
  };
};

#endif
