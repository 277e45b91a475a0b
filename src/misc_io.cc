#include "misc_io.hh"

#include <glob.h>
#include <stdlib.h>
#include <unistd.h>

#include <algorithm>
#include <boost/algorithm/string/trim.hpp>

namespace misc {

std::string expand_special_input_filenames(const std::string& fn) {
  if (fn == "-") {
    return "/dev/stdin";
  } else if (fn == "0") {
    return "/dev/null";
  } else {
    return fn;
  }
}

bool is_directory(const std::string &path) {
  struct stat buffer;
  return (stat(path.c_str(), &buffer) == 0) && S_ISDIR(buffer.st_mode);
}

long getStreamSize(std::ifstream& ifs) {
  ifs.seekg(0, std::ifstream::end);
  size_t total_bytes = ifs.tellg();
  ifs.seekg(0, std::ifstream::beg);
  return total_bytes;
}

bool file_exists(const std::string &filename) {
  if (is_directory(filename)) return false;
  std::ifstream ifile(filename);
  return ifile.is_open();
}

std::string get_temp_fn() {
  char filename[] = "/tmp/latpredict.tmp.XXXXXX";
  int fd = mkstemp(filename);
  CHECK(fd!=-1);
  close(fd);
  VLOG(1) << "created temp file '" << filename << "'";
  return filename;
}

std::string make_file(const std::string &content) {
  std::string fn = get_temp_fn();
  VLOG(1) << "filling file '" << fn << "' with " << content.size() << " bytes of data";
  std::ofstream ostr(fn);
  ostr << content;
  return fn;
}

std::string make_file(const std::string &dir, const std::string &name,
                      const std::string &content) {
  std::string fn = dir + "/" + name;
  VLOG(1) << "filling file '" << fn << "' with " << content.size() << " bytes of data";
  std::ofstream ostr(fn);
  CHECK(ostr.is_open()) << "Error: opening file \"" << fn << "\"";
  ostr << content;
  return fn;
}

std::string make_temp_dir() {
  char dirname[] = "/tmp/latpredict.dir.XXXXXX";
  CHECK(mkdtemp(dirname) != NULL);
  VLOG(1) << "created temp dir '" << dirname << "'";
  return dirname;
}

// sorted list of files matching a shell pattern
std::vector<std::string> glob_files(const std::string &pattern) {
  std::vector<std::string> result;
  glob_t glob_result;
  int rc = glob(pattern.c_str(), 0, NULL, &glob_result);
  if (rc == 0) {
    for (size_t i = 0; i < glob_result.gl_pathc; ++i) {
      result.push_back(glob_result.gl_pathv[i]);
    }
  } else if (rc != GLOB_NOMATCH) {
    LOG(WARNING) << "glob failed for pattern '" << pattern << "' (rc=" << rc << ")";
  }
  globfree(&glob_result);
  std::sort(result.begin(), result.end());
  return result;
}

IFileStream::IFileStream(const std::string &fn) : filesize(0) {
  std::string filename = expand_special_input_filenames(fn);
  ifstr.open(filename.c_str(), std::ios_base::in | std::ios_base::binary);
  if (!ifstr.is_open()) {
    LOG(ERROR) << "Error: opening file \"" << filename << "\"";
    return;
  }
  filesize = misc::getStreamSize(ifstr);
  fifstr.push(ifstr);

  VLOG(1) << "opening file '" << filename << "' for reading, size=" <<
    filesize;
}

boost::iostreams::filtering_istream& IFileStream::get() { return fifstr; }
IFileStream::~IFileStream() {}

std::vector<std::string> readCorpus(const std::string &fn, size_t max_lines) {
  std::vector<std::string> result;
  LOG(INFO) << "read corpus from '" << fn << "' max_lines=" << max_lines;
  IFileStream ifs(fn);
  if (!ifs.is_open()) return result;

  for (std::string str; std::getline(ifs.get(), str);) {
    boost::algorithm::trim(str);
    result.push_back(str);
    if (max_lines > 0 && result.size() >= max_lines) break;
  }

  LOG(INFO) << "done reading " << result.size() << " lines from '" << fn << "'";
  return result;
}
}
