/*
 * obmolopener.cpp
 *
 *  Created on: Jan 10, 2013
 *      Author: dkoes
 */

#include "obmolopener.h"
#include "file.h"
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

using namespace OpenBabel;
using namespace boost::iostreams;

void obmol_opener::clear() {
  //filters were pushed after the files they read from
  for (unsigned i = streams.size(); i > 0; i--) {
    delete streams[i - 1];
  }
  streams.clear();
}

obmol_opener::~obmol_opener() {
  clear();
}

void obmol_opener::openForInput(OBConversion& conv, const std::string& name) {
  //openbabel ignores a trailing .gz when picking the format but won't decompress
  std::string fmtname = name;
  std::string::size_type pos = name.rfind(".gz");
  bool gzipped = pos != std::string::npos && pos + 3 == name.size();
  if (gzipped) fmtname = name.substr(0, pos);

  OBFormat *format = conv.FormatFromExt(fmtname);
  if (!format || !conv.SetInFormat(format)) {
    throw file_error(path(name), true);
  }

  std::ifstream *uncompressed_inmol = new std::ifstream(name.c_str(), std::ios::in | std::ios::binary);
  streams.push_back(uncompressed_inmol);
  filtering_stream<input> *inmol = new filtering_stream<input>();
  streams.push_back((std::istream*) inmol);

  if (gzipped) {
    inmol->push(gzip_decompressor());
  }
  inmol->push(*uncompressed_inmol);

  if (!*uncompressed_inmol || !*inmol) {
    throw file_error(path(name), true);
  }
  conv.SetInStream((std::istream*) inmol);
}
