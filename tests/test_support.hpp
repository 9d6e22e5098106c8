#pragma once

#include <atomic>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

#include <unistd.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

namespace makemcp::testing {

// Helper to run a coroutine synchronously in tests. Exceptions escaping the
// coroutine are rethrown to the caller.
template <typename T>
T run_sync(boost::asio::awaitable<T> coro) {
    boost::asio::io_context ioc;
    std::optional<T> result;
    std::exception_ptr error;
    boost::asio::co_spawn(ioc, std::move(coro),
        [&](std::exception_ptr ep, T value) {
            if (ep) {
                error = ep;
            } else {
                result = std::move(value);
            }
        });
    ioc.run();
    if (error) std::rethrow_exception(error);
    return std::move(*result);
}

inline void run_sync(boost::asio::awaitable<void> coro) {
    boost::asio::io_context ioc;
    std::exception_ptr error;
    boost::asio::co_spawn(ioc, std::move(coro),
        [&](std::exception_ptr ep) { error = ep; });
    ioc.run();
    if (error) std::rethrow_exception(error);
}

// Execution tests drive a real `make`; they are skipped where none is
// installed.
inline auto make_available() -> bool {
    for (const char* dir : {"/usr/bin", "/bin", "/usr/local/bin"}) {
        if (::access((std::string(dir) + "/make").c_str(), X_OK) == 0) return true;
    }
    return false;
}

// RAII scratch directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(std::string_view tag) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("makemcp_" + std::string(tag) + "_" + std::to_string(::getpid()) +
                 "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    auto write(const std::filesystem::path& relative, std::string_view content) const
        -> std::filesystem::path {
        auto full = path_ / relative;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream out(full, std::ios::binary);
        out << content;
        return full;
    }

    auto write_makefile(std::string_view content) const -> std::filesystem::path {
        return write("Makefile", content);
    }

private:
    std::filesystem::path path_;
};

} // namespace makemcp::testing
