#pragma once

#include <filesystem>
#include <fstream>
#include <string>

namespace crec::testing {

// TempDataDir owns a scratch directory under the system temp path. Any leftover from
// an earlier run is removed first; the directory is removed again on destruction.
class TempDataDir {
 public:
  explicit TempDataDir(const std::string& name)
      : path_(std::filesystem::temp_directory_path() / ("crec_test_" + name)) {
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }

  TempDataDir(const TempDataDir&) = delete;
  TempDataDir& operator=(const TempDataDir&) = delete;

  ~TempDataDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }
  [[nodiscard]] std::string str() const { return path_.string(); }

  // Writes content to path()/relative, creating parent directories.
  void write(const std::string& relative, const std::string& content) const {
    const auto file = path_ / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary);
    out << content;
  }

 private:
  std::filesystem::path path_;
};

// Small complete data directory: five catalog items, mapping-shaped embeddings in
// which 1 and 2 point the same way, and one interaction log in which user 42 read
// item 1 and user 7 read items 3 then 4.
inline void write_sample_artifacts(const TempDataDir& dir) {
  dir.write("articles_metadata.csv",
            "article_id,category_id,created_at_ts,publisher_id,words_count\n"
            "1,10,0,0,100\n"
            "2,10,0,0,200\n"
            "3,20,0,0,300\n"
            "4,20,0,0,400\n"
            "5,30,0,0,500\n");
  dir.write("articles_embeddings.json",
            R"({"1": [1.0, 0.0], "2": [0.9, 0.1], "3": [0.0, 1.0], "4": [0.1, 0.9],)"
            R"( "5": [-1.0, 0.0]})");
  dir.write("clicks/clicks_hour_000.csv",
            "user_id,session_id,click_article_id,click_timestamp\n"
            "42,1,1,1000\n"
            "7,2,3,1000\n"
            "7,2,4,2000\n");
}

}  // namespace crec::testing
