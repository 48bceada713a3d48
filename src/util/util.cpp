#include "../pchheader.hpp"
#include "util.hpp"

namespace util
{
    constexpr mode_t DIR_PERMS = 0755;

    /**
     * Hex encodes binary data (keys, signatures, hashes) for logs and config.
     */
    const std::string to_hex(const std::string_view bin)
    {
        std::string hex;
        hex.resize(bin.size() * 2);

        // sodium also writes the terminating '\0', which std::string already reserves.
        sodium_bin2hex(hex.data(), hex.size() + 1,
                       reinterpret_cast<const unsigned char *>(bin.data()), bin.size());
        return hex;
    }

    /**
     * @return The decoded bytes. Empty if the input is not valid hex.
     */
    const std::string to_bin(const std::string_view hex)
    {
        std::string bin;
        bin.resize(hex.size() / 2);

        const char *hex_end;
        size_t bin_len;
        if (sodium_hex2bin(reinterpret_cast<unsigned char *>(bin.data()), bin.size(),
                           hex.data(), hex.size(), "", &bin_len, &hex_end) != 0 ||
            bin_len != bin.size())
            return {};

        return bin;
    }

    uint64_t get_epoch_milliseconds()
    {
        return std::chrono::duration_cast<std::chrono::duration<std::uint64_t, std::milli>>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    /**
     * Default ledger and oracle clock. All challenge timestamps are kept in seconds.
     */
    uint64_t get_epoch_seconds()
    {
        return get_epoch_milliseconds() / 1000;
    }

    void sleep(const uint64_t milliseconds)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
    }

    /**
     * @return Canonical absolute path. Empty if the path does not exist.
     */
    const std::string realpath(const std::string &path)
    {
        std::array<char, PATH_MAX> buffer;
        if (!::realpath(path.c_str(), buffer.data()))
            return {};

        buffer[PATH_MAX - 1] = '\0';
        return buffer.data();
    }

    /**
     * Keeps SIGINT and SIGPIPE off worker threads so only the main thread reacts to an exit signal.
     */
    void mask_signal()
    {
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGINT);
        sigaddset(&mask, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &mask, NULL);
    }

    bool is_dir_exists(std::string_view path)
    {
        struct stat st;
        return (stat(path.data(), &st) == 0 && S_ISDIR(st.st_mode));
    }

    bool is_file_exists(std::string_view path)
    {
        struct stat st;
        return (stat(path.data(), &st) == 0 && S_ISREG(st.st_mode));
    }

    /**
     * Creates the directory along with any missing parents (like mkdir -p).
     * @return 0 on success. -1 on failure.
     */
    int create_dir_tree_recursive(std::string_view path)
    {
        if (path == "/" || is_dir_exists(path))
            return 0;

        char *path_copy = strdup(path.data());
        const int parent_res = create_dir_tree_recursive(dirname(path_copy));
        free(path_copy);

        if (parent_res == -1)
            return -1;

        if (mkdir(path.data(), DIR_PERMS) == -1 && errno != EEXIST)
        {
            LOG_ERROR << errno << ": Error creating directory " << path;
            return -1;
        }

        return 0;
    }

    /**
     * Reads the file behind an open descriptor from the given offset to its end.
     * @return Number of bytes read. -1 on error.
     */
    int read_from_fd(const int fd, std::string &buf, const off_t offset)
    {
        struct stat st;
        if (fstat(fd, &st) == -1)
        {
            LOG_ERROR << errno << ": Error in stat for reading file.";
            return -1;
        }

        buf.resize(st.st_size - offset);
        return pread(fd, buf.data(), buf.size(), offset);
    }

    /**
     * @return Number of bytes read. -1 on error.
     */
    int read_file(std::string_view path, std::string &buf)
    {
        const int fd = open(path.data(), O_RDONLY);
        if (fd == -1)
        {
            LOG_ERROR << errno << ": Error opening " << path;
            return -1;
        }

        const int res = read_from_fd(fd, buf);
        close(fd);
        return res;
    }

    /**
     * Places a non-blocking record lock on the file. Used to keep two nodes off the same node directory.
     * @return 0 if the lock was acquired. -1 otherwise.
     */
    int set_lock(const int fd, struct flock &lock, const bool is_rwlock, const off_t start, const off_t len)
    {
        lock.l_type = is_rwlock ? F_WRLCK : F_RDLCK;
        lock.l_whence = SEEK_SET;
        lock.l_start = start;
        lock.l_len = len;
        return fcntl(fd, F_SETLK, &lock);
    }

    int release_lock(const int fd, struct flock &lock)
    {
        lock.l_type = F_UNLCK;
        return fcntl(fd, F_SETLKW, &lock);
    }

    /**
     * Big endian bytes of the number. Used wherever ids and timestamps are bound into a signed digest.
     */
    const std::string uint64_to_string_bytes(const uint64_t x)
    {
        std::string s(sizeof(uint64_t), '\0');
        for (size_t i = 0; i < sizeof(uint64_t); i++)
            s[i] = static_cast<char>((x >> (8 * (sizeof(uint64_t) - 1 - i))) & 0xff);
        return s;
    }

} // namespace util
