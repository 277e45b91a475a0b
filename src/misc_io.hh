#ifndef MISC_IO_H_
#define MISC_IO_H_

#include <glog/logging.h>
#include <sys/stat.h>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <boost/iostreams/filtering_stream.hpp>

namespace misc {

long getStreamSize(std::ifstream& ifs);
bool file_exists(const std::string &filename);
bool is_directory(const std::string &path);

std::string expand_special_input_filenames(const std::string& fn);
std::string get_temp_fn();
std::string make_file(const std::string &content);
std::string make_file(const std::string &dir, const std::string &name,
                      const std::string &content);
std::string make_temp_dir();
std::vector<std::string> glob_files(const std::string &pattern);
std::vector<std::string> readCorpus(const std::string &fn, size_t max_lines = 0);

class IFileStream {
public:
    IFileStream(const std::string &fn);
    virtual ~IFileStream();
    boost::iostreams::filtering_istream& get();
    bool is_open() const {
      return ifstr.is_open();
    }
private:
    std::ifstream ifstr;
    boost::iostreams::filtering_istream fifstr;
    size_t filesize;
};
}
#endif /* MISC_IO_H_ */
