#include "infra/safe_file_writer.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> read_lines(const fs::path &path) {
  std::ifstream ifs(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(ifs, line)) {
    lines.push_back(line);
  }
  return lines;
}

} // namespace

TEST(SafeFileWriterTest, AppendsLines) {
  const fs::path base = fs::temp_directory_path() / "easythreads_writer_append";
  fs::remove_all(base);
  const fs::path file = base / "nested" / "out.txt";

  {
    easythreads::infra::SafeFileWriter writer(file.string());
    writer.write("first");
    writer.write("second");
    EXPECT_EQ(writer.path(), file.string());
  }
  {
    // A new writer appends rather than truncating.
    easythreads::infra::SafeFileWriter writer(file.string());
    writer.write("third");
  }

  EXPECT_EQ(read_lines(file),
            (std::vector<std::string>{"first", "second", "third"}));
  fs::remove_all(base);
}

TEST(SafeFileWriterTest, ConcurrentWritesNeverInterleave) {
  const fs::path base =
      fs::temp_directory_path() / "easythreads_writer_concurrent";
  fs::remove_all(base);
  const fs::path file = base / "out.txt";

  constexpr int kThreads = 8;
  constexpr int kLines = 200;
  easythreads::infra::SafeFileWriter writer(file.string());

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&writer, t]() {
      const std::string payload(64, static_cast<char>('a' + t));
      for (int i = 0; i < kLines; ++i) {
        writer.write(payload);
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  const auto lines = read_lines(file);
  ASSERT_EQ(lines.size(), static_cast<size_t>(kThreads * kLines));

  std::map<char, int> per_writer;
  for (const auto &line : lines) {
    ASSERT_EQ(line.size(), 64u);
    ASSERT_EQ(line.find_first_not_of(line[0]), std::string::npos);
    ++per_writer[line[0]];
  }
  EXPECT_EQ(per_writer.size(), static_cast<size_t>(kThreads));
  for (const auto &[ch, count] : per_writer) {
    EXPECT_EQ(count, kLines) << "writer " << ch;
  }
  fs::remove_all(base);
}

TEST(SafeFileWriterTest, UnwritablePathThrowsRuntimeError) {
  const fs::path base = fs::temp_directory_path() / "easythreads_writer_dir";
  fs::remove_all(base);
  fs::create_directories(base);

  // The target is a directory, so it cannot be opened for append.
  easythreads::infra::SafeFileWriter writer(base.string());
  try {
    writer.write("data");
    FAIL() << "expected std::runtime_error";
  } catch (const std::runtime_error &e) {
    EXPECT_NE(std::string(e.what()).find(base.string()), std::string::npos);
  }
  fs::remove_all(base);
}
