#ifndef _STC_CONF_
#define _STC_CONF_

#include "pchheader.hpp"
#include "util/util.hpp"

/**
 * Manages the central config and context structs.
 * Contains functions to config operations such as create/rekey/load.
 */
namespace conf
{
    struct node_config
    {
        // Config elements which are initialized in memory (these are not directly loaded from the config file)
        std::string public_key;  // Node public key bytes. This is the key the attestation service signs with.
        std::string private_key; // Node private key bytes.

        std::string public_key_hex;  // Node hex public key
        std::string private_key_hex; // Node hex private key
    };

    struct ledger_config
    {
        std::string attester_key_hex; // Hex attester key registered when the ledger db is first created.

        // Config element which are initialized in memory (This is not directly loaded from the config file)
        std::string attester_key; // Binary attester key.
    };

    struct oracle_config
    {
        uint32_t sync_interval = 0; // Seconds between two background mileage sweeps.
        uint32_t fetch_timeout = 0; // Max ms a single mileage fetch may take.
        std::string mileage_file;   // Activity data file path (relative to the node dir).
    };

    // Holds contextual information about the currently loaded node directory.
    struct node_ctx
    {
        std::string command; // The CLI command issued to launch stridecore
        std::string exe_dir; // stridecore executable dir.

        std::string node_dir;    // Node base directory full path.
        std::string config_dir;  // Config dir full path.
        std::string config_file; // Full path to the config file.
        std::string data_dir;    // Ledger and oracle db dir full path.
        std::string log_dir;     // Log dir full path.

        int config_fd = -1;       // Config file file descriptor.
        struct flock config_lock; // Config file lock.
    };

    // Log severity levels used in stridecore.
    enum LOG_SEVERITY
    {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    struct log_config
    {
        std::string log_level;                   // Log severity level (dbg, inf, wrn, wrr)
        LOG_SEVERITY log_level_type;             // Log severity level enum (debug, info, warn, error)
        std::unordered_set<std::string> loggers; // List of enabled loggers (console, file)
        size_t max_mbytes_per_file = 0;          // Max MB size of a single log file.
        size_t max_file_count = 0;               // Max no. of log files to keep.
    };

    // Holds all the config values.
    struct stc_config
    {
        std::string version;
        node_config node;
        ledger_config ledger;
        oracle_config oracle;
        log_config log;
    };

    // Global node context struct exposed to the application.
    // Other modeuls will access context values via this.
    extern node_ctx ctx;

    // Global configuration struct exposed to the application.
    // Other modeuls will access config values via this.
    extern stc_config cfg;

    int init();

    void deinit();

    int rekey();

    int create_node_dir();

    void set_dir_paths(std::string exepath, std::string basedir);

    //------Internal-use functions for this namespace.

    int read_config(stc_config &cfg);

    int write_config(const stc_config &cfg);

    int validate_config(const stc_config &cfg);

    int validate_dir_paths();

    LOG_SEVERITY get_loglevel_type(std::string_view severity);

    const std::string extract_missing_field(std::string err_message);

    int set_config_lock();

    int release_config_lock();

    int write_json_file(const std::string &file_path, const jsoncons::ojson &d);

} // namespace conf

#endif
