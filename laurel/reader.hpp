// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __LAUREL__READER__HPP__
#define __LAUREL__READER__HPP__ 1

// line reader for the dictionary files.
// Blank lines, lines starting with '#' or "<!", " #" trailing comments and
// <!-- --> comments (possibly spanning lines) are skipped.
//

#include <string>
#include <iostream>

#include <boost/filesystem/path.hpp>
#include <boost/shared_ptr.hpp>

namespace laurel
{
  class Reader
  {
  public:
    typedef boost::filesystem::path path_type;
    
  public:
    // throws std::runtime_error when the file does not exist
    explicit Reader(const path_type& path);
    Reader(std::istream& is, const std::string& name);
    
  public:
    // next non-comment line with its trailing white spaces removed. false at EOF
    bool getline(std::string& line);
    
    // line number of the last line read
    int lineno() const { return lineno_; }
    const std::string& name() const { return name_; }
    
    // prefix for a warning on the current line
    std::ostream& warning() const;
    
  private:
    boost::shared_ptr<std::istream> stream_;
    std::istream* is_;
    std::string   name_;
    int           lineno_;
  };
};

#endif
