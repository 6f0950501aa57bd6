// semtok/test_support/temp_workspace.hpp - Scratch directory for config and query files
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>

namespace semtok::test_support
{

/// Creates a unique directory under the system temp dir, removed on destruction.
class TempWorkspace
{
public:
  TempWorkspace()
  {
    static std::atomic<int> counter{0};
    const auto base = std::filesystem::temp_directory_path();
    do {
      root_ = base / ("semtok_test_" + std::to_string(std::random_device{}()) + "_" +
                      std::to_string(counter++));
    } while (std::filesystem::exists(root_));
    std::filesystem::create_directories(root_);
  }

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace & operator=(const TempWorkspace &) = delete;

  ~TempWorkspace()
  {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  [[nodiscard]] const std::filesystem::path & root() const noexcept { return root_; }

  /// Write `content` to `relative` (parent directories created) and return the absolute path.
  std::filesystem::path write(const std::filesystem::path & relative, std::string_view content) const
  {
    const auto path = root_ / relative;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return path;
  }

private:
  std::filesystem::path root_;
};

}  // namespace semtok::test_support
