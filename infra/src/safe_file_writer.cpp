#include "infra/safe_file_writer.h"

#include <filesystem>
#include <stdexcept>
#include <utility>

namespace easythreads::infra {

SafeFileWriter::SafeFileWriter(std::string path) : path_(std::move(path)) {}

void SafeFileWriter::write(const std::string &data) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!out_.is_open()) {
    const std::filesystem::path file_path(path_);
    if (file_path.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(file_path.parent_path(), ec);
    }
    out_.open(file_path, std::ios::app);
    if (!out_) {
      throw std::runtime_error("Cannot open " + path_ + " for append");
    }
  }

  out_ << data << '\n';
  out_.flush();
  if (!out_) {
    out_.close();
    out_.clear();
    throw std::runtime_error("Write to " + path_ + " failed");
  }
}

} // namespace easythreads::infra
