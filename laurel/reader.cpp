//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "reader.hpp"

#include "utils/compress_stream.hpp"

namespace laurel
{
  Reader::Reader(const path_type& path)
    : stream_(new utils::compress_istream(path, 1024 * 1024)),
      is_(0),
      name_(path.string()),
      lineno_(0)
  {
    is_ = stream_.get();
  }
  
  Reader::Reader(std::istream& is, const std::string& name)
    : stream_(), is_(&is), name_(name), lineno_(0) {}
  
  std::ostream& Reader::warning() const
  {
    return std::cerr << "warning: " << name_ << ':' << lineno_ << ": ";
  }
  
  static inline
  void strip_right(std::string& line)
  {
    std::string::size_type last = line.find_last_not_of(" \t\r\n");
    line.erase(last == std::string::npos ? 0 : last + 1);
  }
  
  bool Reader::getline(std::string& line)
  {
    while (std::getline(*is_, line)) {
      ++ lineno_;
      
      if (line.empty() || line[0] == '#')
	continue;
      
      const std::string::size_type pos_open = line.find("<!--");
      if (pos_open != std::string::npos) {
	const std::string::size_type pos_close = line.find("-->", pos_open + 4);
	
	if (pos_close != std::string::npos)
	  line.erase(pos_open, pos_close + 3 - pos_open);
	else {
	  // the comment continues until a line with -->
	  line.erase(pos_open);
	  
	  std::string buffer;
	  while (std::getline(*is_, buffer)) {
	    ++ lineno_;
	    if (buffer.find("-->") != std::string::npos)
	      break;
	  }
	}
      } else if (line.compare(0, 2, "<!") == 0)
	continue;
      
      const std::string::size_type pos_comment = line.rfind(" #");
      if (pos_comment != std::string::npos)
	line.erase(pos_comment);
      
      strip_right(line);
      
      if (line.find_first_not_of(" \t") == std::string::npos)
	continue;
      
      return true;
    }
    
    line.clear();
    return false;
  }
};
