// -*- mode: c++ -*-
//
//  Copyright(C) 2009-2010 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __UTILS__COMPRESS_STREAM__HPP__
#define __UTILS__COMPRESS_STREAM__HPP__ 1

// filtering streams which transparently handle gzip/bzip2 compressed files.
// "-" denotes stdin/stdout
//

#include <cstring>
#include <iostream>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/device/file_descriptor.hpp>
#include <boost/iostreams/device/file.hpp>

#include <boost/filesystem.hpp>

namespace utils
{
  namespace impl
  {
    enum compress_format_type {
      COMPRESS_STREAM_GZIP,
      COMPRESS_STREAM_BZIP,
      COMPRESS_STREAM_NONE,
    };
    
    // input: sniff the magic number
    inline
    compress_format_type compress_format_magic(const boost::filesystem::path& path)
    {
      char buffer[4];
      ::memset(buffer, 0, sizeof(buffer));
      
      std::ifstream ifs(path.string().c_str(), std::ios_base::in | std::ios_base::binary);
      ifs.read(buffer, 3);
      
      if (buffer[0] == '\037' && buffer[1] == '\213')
	return COMPRESS_STREAM_GZIP;
      else if (buffer[0] == 'B' && buffer[1] == 'Z' && buffer[2] == 'h')
	return COMPRESS_STREAM_BZIP;
      else
	return COMPRESS_STREAM_NONE;
    }
    
    // output: decide by the extension
    inline
    compress_format_type compress_format_extension(const boost::filesystem::path& path)
    {
      const std::string extension = path.extension().string();
      
      if (extension == ".gz")
	return COMPRESS_STREAM_GZIP;
      else if (extension == ".bz2")
	return COMPRESS_STREAM_BZIP;
      else
	return COMPRESS_STREAM_NONE;
    }
  };
  
  class compress_istream : public boost::iostreams::filtering_istream
  {
  public:
    typedef boost::filesystem::path path_type;
    
  public:
    compress_istream(const path_type& path, size_t buffer_size = 4096)
    {
      if (path.string() == "-") {
	push(boost::iostreams::file_descriptor_source(::dup(STDIN_FILENO), boost::iostreams::close_handle), buffer_size);
	return;
      }
      
      if (! boost::filesystem::exists(path))
	throw std::runtime_error("no file? " + path.string());
      
      if (boost::filesystem::is_regular_file(path))
	switch (impl::compress_format_magic(path)) {
	case impl::COMPRESS_STREAM_GZIP: push(boost::iostreams::gzip_decompressor()); break;
	case impl::COMPRESS_STREAM_BZIP: push(boost::iostreams::bzip2_decompressor()); break;
	default: break;
	}
      
      push(boost::iostreams::file_source(path.string()), buffer_size);
    }
  };
  
  class compress_ostream : public boost::iostreams::filtering_ostream
  {
  public:
    typedef boost::filesystem::path path_type;
    
  public:
    compress_ostream(const path_type& path, size_t buffer_size = 4096)
    {
      if (path.string() == "-") {
	push(boost::iostreams::file_descriptor_sink(::dup(STDOUT_FILENO), boost::iostreams::close_handle), buffer_size);
	return;
      }
      
      switch (impl::compress_format_extension(path)) {
      case impl::COMPRESS_STREAM_GZIP: push(boost::iostreams::gzip_compressor()); break;
      case impl::COMPRESS_STREAM_BZIP: push(boost::iostreams::bzip2_compressor()); break;
      default: break;
      }
      
      push(boost::iostreams::file_sink(path.string(), std::ios_base::out | std::ios_base::trunc), buffer_size);
    }
  };
};

#endif
