#pragma once
/** @file  TempDir.hpp
 *  @brief Scratch directory removed when the test ends.
 */

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

namespace airbeacon {
  namespace test {

    class TempDir {
    public:
      TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("airbeacon_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
      }

      ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
      }

      TempDir(const TempDir&) = delete;
      TempDir& operator=(const TempDir&) = delete;

      std::filesystem::path file(const std::string& name) const { return path_ / name; }

      std::filesystem::path write(const std::string& name, const std::vector<uint8_t>& bytes) const {
        auto target = file(name);
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return target;
      }

      std::filesystem::path write_text(const std::string& name, const std::string& text) const {
        auto target = file(name);
        std::ofstream out(target, std::ios::trunc);
        out << text;
        return target;
      }

    private:
      std::filesystem::path path_;
    };

  } // namespace test
} // namespace airbeacon
