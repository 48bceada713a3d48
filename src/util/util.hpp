#ifndef _STC_UTIL_UTIL_
#define _STC_UTIL_UTIL_

#include "../pchheader.hpp"

/**
 * Helpers shared by the config, ledger and oracle subsystems.
 */
namespace util
{
    const std::string to_hex(const std::string_view bin);

    const std::string to_bin(const std::string_view hex);

    uint64_t get_epoch_milliseconds();

    uint64_t get_epoch_seconds();

    void sleep(const uint64_t milliseconds);

    const std::string realpath(const std::string &path);

    void mask_signal();

    bool is_dir_exists(std::string_view path);

    bool is_file_exists(std::string_view path);

    int create_dir_tree_recursive(std::string_view path);

    int read_from_fd(const int fd, std::string &buf, const off_t offset = 0);

    int read_file(std::string_view path, std::string &buf);

    int set_lock(const int fd, struct flock &lock, const bool is_rwlock, const off_t start, const off_t len);

    int release_lock(const int fd, struct flock &lock);

    const std::string uint64_to_string_bytes(const uint64_t x);

} // namespace util

#endif
