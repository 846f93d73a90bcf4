// ArbPerf - Test Support

#ifndef ARBPERF_TEST_SUPPORT_HPP
#define ARBPERF_TEST_SUPPORT_HPP

#include <filesystem>
#include <random>
#include <sstream>
#include <string>
#include <system_error>

namespace arbperf::testing {

// Fresh directory under the system temp dir, removed with its contents
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::ostringstream oss;
        oss << "arbperf_test_" << std::hex << rd() << rd();
        path_ = std::filesystem::temp_directory_path() / oss.str();
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

}  // namespace arbperf::testing

#endif  // ARBPERF_TEST_SUPPORT_HPP
