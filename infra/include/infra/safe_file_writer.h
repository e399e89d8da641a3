#pragma once

#include <fstream>
#include <mutex>
#include <string>

namespace easythreads::infra {

/// Locked-append file sink shared by concurrent task bodies. Each write()
/// lands as one whole line.
class SafeFileWriter {
public:
  explicit SafeFileWriter(std::string path);

  SafeFileWriter(const SafeFileWriter &) = delete;
  SafeFileWriter &operator=(const SafeFileWriter &) = delete;

  /// Appends `data` and a newline. Throws std::runtime_error naming the
  /// path when the file cannot be opened or written.
  void write(const std::string &data);

  [[nodiscard]] const std::string &path() const { return path_; }

private:
  std::string path_;
  std::mutex mutex_;
  std::ofstream out_;
};

} // namespace easythreads::infra
