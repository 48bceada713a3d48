#include "pchheader.hpp"
#include "conf.hpp"
#include "crypto.hpp"
#include "util/util.hpp"
#include "util/version.hpp"

namespace conf
{

    // Global node context struct exposed to the application.
    node_ctx ctx;

    // Global configuration struct exposed to the application.
    stc_config cfg;

    constexpr int FILE_PERMS = 0644;

    constexpr uint32_t DEFAULT_SYNC_INTERVAL = 3600; // Hourly mileage sweep.
    constexpr uint32_t DEFAULT_FETCH_TIMEOUT = 10000;
    constexpr const char *DEFAULT_MILEAGE_FILE = "data/mileage.json";

    bool init_success = false;

    /**
     * Loads and initializes the config for execution. Must be called once during application startup.
     * @return 0 for success. -1 for failure.
     */
    int init()
    {
        // The validations/loading needs to be in this order.
        // 1. Validate node directories
        // 2. Lock the config so no other instance runs on the same dir
        // 3. Read and load the config into memory
        // 4. Validate the loaded config values

        if (validate_dir_paths() == -1 ||
            set_config_lock() == -1)
            return -1;

        if (read_config(cfg) == -1 ||
            validate_config(cfg) == -1)
        {
            release_config_lock();
            return -1;
        }

        init_success = true;
        return 0;
    }

    /**
     * Cleanup any resources.
     */
    void deinit()
    {
        if (init_success)
        {
            // Releases the config file lock at the termination.
            release_config_lock();
            init_success = false;
        }
    }

    /**
     * Generates and saves new signing keys in the config.
     * The registered attester key is left untouched. Rotating the attester is a ledger operation.
     */
    int rekey()
    {
        // Locking the config file at the startup. To check whether there's any already running instances.
        if (set_config_lock() == -1)
            return -1;

        // Load the config and re-save with the newly generated keys.
        stc_config cfg = {};
        if (read_config(cfg) != 0)
        {
            release_config_lock();
            return -1;
        }

        crypto::generate_signing_keys(cfg.node.public_key, cfg.node.private_key);
        cfg.node.public_key_hex = util::to_hex(cfg.node.public_key);
        cfg.node.private_key_hex = util::to_hex(cfg.node.private_key);

        if (write_config(cfg) != 0)
        {
            release_config_lock();
            return -1;
        }

        std::cout << "New signing keys generated at " << ctx.config_file << std::endl;

        // Releases the config file lock at the termination.
        release_config_lock();

        return 0;
    }

    /**
     * Creates a new node directory with the default config.
     * By the time this gets called, the 'ctx' struct must be populated.
     * This function makes use of the paths populated in the ctx.
     */
    int create_node_dir()
    {
        if (util::is_dir_exists(ctx.node_dir))
        {
            std::cerr << "Node dir already exists. Cannot create node at the same location.\n";
            return -1;
        }

        // Recursivly create node directories. Return an error if unable to create
        if (util::create_dir_tree_recursive(ctx.config_dir) == -1 ||
            util::create_dir_tree_recursive(ctx.data_dir) == -1 ||
            util::create_dir_tree_recursive(ctx.log_dir) == -1)
        {
            std::cerr << "ERROR: unable to create directories.\n";
            return -1;
        }

        //Create config file with default settings.

        //We populate the in-memory struct with default settings and then save it to the file.
        {
            stc_config cfg = {};

            crypto::generate_signing_keys(cfg.node.public_key, cfg.node.private_key);
            cfg.node.public_key_hex = util::to_hex(cfg.node.public_key);
            cfg.node.private_key_hex = util::to_hex(cfg.node.private_key);

            cfg.version = version::STC_VERSION;

            // This node is the initial attester of its own ledger.
            cfg.ledger.attester_key_hex = cfg.node.public_key_hex;

            cfg.oracle.sync_interval = DEFAULT_SYNC_INTERVAL;
            cfg.oracle.fetch_timeout = DEFAULT_FETCH_TIMEOUT;
            cfg.oracle.mileage_file = DEFAULT_MILEAGE_FILE;

            cfg.log.max_file_count = 50;
            cfg.log.max_mbytes_per_file = 10;
            cfg.log.log_level = "inf";
            cfg.log.loggers.emplace("console");
            cfg.log.loggers.emplace("file");

            //Save the default settings into the config file.
            if (write_config(cfg) != 0)
                return -1;
        }

        // Empty activity data file so the node can start right away.
        {
            const jsoncons::ojson mileage(jsoncons::json_object_arg);
            if (write_json_file(ctx.node_dir + "/" + DEFAULT_MILEAGE_FILE, mileage) == -1)
                return -1;
        }

        std::cout << "Node directory created at " << ctx.node_dir << std::endl;

        return 0;
    }

    /**
     * Updates the node context with directory paths based on provided base directory.
     * This is called after parsing the command line arg in order to populate the ctx.
     */
    void set_dir_paths(std::string exepath, std::string basedir)
    {
        if (exepath.empty())
        {
            // this code branch will never execute the way main is currently coded, but it might change in future
            std::cerr << "Executable path must be specified\n";
            exit(1);
        }

        if (basedir.empty())
        {
            // this code branch will never execute the way main is currently coded, but it might change in future
            std::cerr << "a node directory must be specified\n";
            exit(1);
        }

        // resolving the path through realpath will remove any trailing slash if present.
        // realpath gives empty for a dir which is yet to be created, so keep the given path in that case.
        const std::string resolved = util::realpath(basedir);
        if (!resolved.empty())
            basedir = resolved;
        exepath = util::realpath(exepath);

        // Take the parent directory path.
        ctx.exe_dir = dirname(exepath.data());

        ctx.node_dir = basedir;
        ctx.config_dir = basedir + "/cfg";
        ctx.config_file = ctx.config_dir + "/stridecore.cfg";
        ctx.data_dir = basedir + "/data";
        ctx.log_dir = basedir + "/log";
    }

    /**
     * Reads the config file on disk and populates the in-memory 'cfg' struct.
     * @return 0 for successful loading of config. -1 for failure.
     */
    int read_config(stc_config &cfg)
    {
        // Read the config file into json document object.
        std::string buf;
        if (util::read_from_fd(ctx.config_fd, buf) == -1)
        {
            std::cerr << "Error reading from the config file. " << errno << '\n';
            return -1;
        }

        jsoncons::ojson d;
        try
        {
            d = jsoncons::ojson::parse(buf, jsoncons::strict_json_parsing());
        }
        catch (const std::exception &e)
        {
            std::cerr << "Invalid config file format. " << e.what() << '\n';
            return -1;
        }
        buf.clear();

        try
        {
            // Check whether the version is specified.
            cfg.version = d["version"].as<std::string>();
            if (cfg.version.empty())
            {
                std::cerr << "Config version missing.\n";
                return -1;
            }

            // Check whether this config complies with the min version requirement.
            const int verresult = version::version_compare(cfg.version, std::string(version::MIN_CONFIG_VERSION));
            if (verresult == -1)
            {
                std::cerr << "Config version too old. Minimum "
                          << version::MIN_CONFIG_VERSION << " required. "
                          << cfg.version << " found.\n";
                return -1;
            }
            else if (verresult == -2)
            {
                std::cerr << "Malformed version string.\n";
                return -1;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "Required config field version missing at " << ctx.config_file << std::endl;
            return -1;
        }

        // node
        {
            try
            {
                const jsoncons::ojson &node = d["node"];
                cfg.node.public_key_hex = node["public_key"].as<std::string>();
                cfg.node.private_key_hex = node["private_key"].as<std::string>();

                // Convert the hex keys to binary.
                cfg.node.public_key = util::to_bin(cfg.node.public_key_hex);
                if (cfg.node.public_key.empty())
                {
                    std::cerr << "Error decoding hex public key.\n";
                    return -1;
                }

                cfg.node.private_key = util::to_bin(cfg.node.private_key_hex);
                if (cfg.node.private_key.empty())
                {
                    std::cerr << "Error decoding hex private key.\n";
                    return -1;
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required node config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        // ledger
        {
            try
            {
                const jsoncons::ojson &ledger = d["ledger"];
                cfg.ledger.attester_key_hex = ledger["attester_key"].as<std::string>();
                cfg.ledger.attester_key = util::to_bin(cfg.ledger.attester_key_hex);
                if (cfg.ledger.attester_key.empty())
                {
                    std::cerr << "Error decoding hex attester key.\n";
                    return -1;
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required ledger config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        // oracle
        {
            try
            {
                const jsoncons::ojson &oracle = d["oracle"];
                cfg.oracle.sync_interval = oracle["sync_interval"].as<uint32_t>();
                cfg.oracle.fetch_timeout = oracle["fetch_timeout"].as<uint32_t>();
                cfg.oracle.mileage_file = oracle["mileage_file"].as<std::string>();
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required oracle config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        // log
        {
            try
            {
                const jsoncons::ojson &log = d["log"];
                cfg.log.log_level = log["log_level"].as<std::string>();
                cfg.log.log_level_type = get_loglevel_type(cfg.log.log_level);
                cfg.log.max_mbytes_per_file = log["max_mbytes_per_file"].as<size_t>();
                cfg.log.max_file_count = log["max_file_count"].as<size_t>();
                cfg.log.loggers.clear();
                for (auto &v : log["loggers"].array_range())
                    cfg.log.loggers.emplace(v.as<std::string>());
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required log config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        return 0;
    }

    /**
     * Saves the provided 'cfg' struct into the config file.
     * @return 0 for successful save. -1 for failure.
     */
    int write_config(const stc_config &cfg)
    {
        // Popualte json document with 'cfg' values.
        // ojson is used instead of json to preserve insertion order.
        jsoncons::ojson d;
        d.insert_or_assign("version", cfg.version);

        // Node config.
        {
            jsoncons::ojson node_config;
            node_config.insert_or_assign("public_key", cfg.node.public_key_hex);
            node_config.insert_or_assign("private_key", cfg.node.private_key_hex);
            d.insert_or_assign("node", node_config);
        }

        // Ledger config.
        {
            jsoncons::ojson ledger_config;
            ledger_config.insert_or_assign("attester_key", cfg.ledger.attester_key_hex);
            d.insert_or_assign("ledger", ledger_config);
        }

        // Oracle config.
        {
            jsoncons::ojson oracle_config;
            oracle_config.insert_or_assign("sync_interval", cfg.oracle.sync_interval);
            oracle_config.insert_or_assign("fetch_timeout", cfg.oracle.fetch_timeout);
            oracle_config.insert_or_assign("mileage_file", cfg.oracle.mileage_file);
            d.insert_or_assign("oracle", oracle_config);
        }

        // Log configs.
        {
            jsoncons::ojson log_config;
            log_config.insert_or_assign("log_level", cfg.log.log_level);
            log_config.insert_or_assign("max_mbytes_per_file", cfg.log.max_mbytes_per_file);
            log_config.insert_or_assign("max_file_count", cfg.log.max_file_count);

            jsoncons::ojson loggers(jsoncons::json_array_arg);
            for (std::string_view logger : cfg.log.loggers)
            {
                loggers.push_back(logger);
            }
            log_config.insert_or_assign("loggers", loggers);
            d.insert_or_assign("log", log_config);
        }

        return write_json_file(ctx.config_file, d);
    }

    /**
     * Validates the 'cfg' struct for invalid values.
     *
     * @return 0 for successful validation. -1 for failure.
     */
    int validate_config(const stc_config &cfg)
    {
        // Check for non-empty signing keys.
        // We also check for key pair validity as well in the below code.
        if (cfg.node.public_key_hex.empty() || cfg.node.private_key_hex.empty())
        {
            std::cerr << "Signing keys missing. Run with 'rekey' to generate new keys.\n";
            return -1;
        }

        // Other required fields.

        bool fields_missing = false;

        fields_missing |= cfg.oracle.sync_interval == 0 && std::cerr << "Missing cfg field: sync_interval\n";
        fields_missing |= cfg.oracle.fetch_timeout == 0 && std::cerr << "Missing cfg field: fetch_timeout\n";
        fields_missing |= cfg.oracle.mileage_file.empty() && std::cerr << "Missing cfg field: mileage_file\n";
        fields_missing |= cfg.log.log_level.empty() && std::cerr << "Missing cfg field: log_level\n";
        fields_missing |= cfg.log.loggers.empty() && std::cerr << "Missing cfg field: loggers\n";

        if (fields_missing)
        {
            std::cerr << "Required configuration fields missing at " << ctx.config_file << std::endl;
            return -1;
        }

        if (!crypto::is_valid_pubkey(cfg.ledger.attester_key))
        {
            std::cerr << "Invalid ledger attester_key. ed25519 prefixed public key expected.\n";
            return -1;
        }

        // Log settings
        const std::unordered_set<std::string> valid_loglevels({"dbg", "inf", "wrn", "err"});
        if (valid_loglevels.count(cfg.log.log_level) != 1)
        {
            std::cerr << "Invalid loglevel configured. Valid values: dbg|inf|wrn|err\n";
            return -1;
        }

        const std::unordered_set<std::string> valid_loggers({"console", "file"});
        for (const std::string &logger : cfg.log.loggers)
        {
            if (valid_loggers.count(logger) != 1)
            {
                std::cerr << "Invalid logger. Valid values: console|file\n";
                return -1;
            }
        }

        //Sign and verify a sample message to ensure we have a matching signing key pair.
        if (cfg.node.private_key.size() != crypto::PFXD_SECKEY_BYTES)
        {
            std::cerr << "Invalid signing keys. Run with 'rekey' to generate new keys.\n";
            return -1;
        }
        const std::string msg = "stridecore";
        const std::string sig = crypto::sign(msg, cfg.node.private_key);
        if (crypto::verify(msg, sig, cfg.node.public_key) != 0)
        {
            std::cerr << "Invalid signing keys. Run with 'rekey' to generate new keys.\n";
            return -1;
        }

        return 0;
    }

    /**
     * Checks for the existence of all node sub directories.
     *
     * @return 0 for successful validation. -1 for failure.
     */
    int validate_dir_paths()
    {
        const std::string paths[4] = {
            ctx.node_dir,
            ctx.config_file,
            ctx.data_dir,
            ctx.log_dir};

        for (const std::string &path : paths)
        {
            if (!util::is_file_exists(path) && !util::is_dir_exists(path))
            {
                std::cerr << path << " does not exist.\n";
                return -1;
            }
        }

        return 0;
    }

    /**
     * Convert string to Log Severity enum type.
     * @param severity log severity code.
     * @return log severity type.
    */
    LOG_SEVERITY get_loglevel_type(std::string_view severity)
    {
        if (severity == "dbg")
            return LOG_SEVERITY::DEBUG;
        else if (severity == "wrn")
            return LOG_SEVERITY::WARN;
        else if (severity == "inf")
            return LOG_SEVERITY::INFO;
        else
            return LOG_SEVERITY::ERROR;
    }

    /**
     * Extracts missing config field from the jsoncons exception message.
     * @param err_message Jsoncons error message.
     * @return Missing config field.
    */
    const std::string extract_missing_field(std::string err_message)
    {
        err_message.erase(0, err_message.find("'") + 1);
        return err_message.substr(0, err_message.find("'"));
    }

    /**
     * Locks the config file. If already locked means there's another stridecore instance running in the same directory.
     * If so, log error and return, Otherwise lock the config.
     * @return Returns 0 if lock is successfully aquired, -1 on error.
    */
    int set_config_lock()
    {
        ctx.config_fd = open(ctx.config_file.data(), O_RDWR, 444);
        if (ctx.config_fd == -1)
        {
            std::cerr << "Error opening the config file " << ctx.config_file << "\n";
            return -1;
        }

        if (util::set_lock(ctx.config_fd, ctx.config_lock, true, 0, 0) == -1)
        {
            if (errno == EACCES || errno == EAGAIN)
            {
                std::cerr << "Another stridecore instance is already running in directory " << ctx.node_dir << "\n";
            }
            // Close fd if lock aquiring failed.
            close(ctx.config_fd);
            ctx.config_fd = -1;
            return -1;
        }

        return 0;
    }

    /**
     * Releases the config file and closes the opened file descriptor.
     * @return Returns 0 if lock is successfully released, -1 on error.
    */
    int release_config_lock()
    {
        if (ctx.config_fd == -1)
            return 0;

        const int res = util::release_lock(ctx.config_fd, ctx.config_lock);
        // Close fd in termination.
        close(ctx.config_fd);
        ctx.config_fd = -1;
        return res;
    }

    /**
     * Writes the given json doc to a file.
     * @return 0 on success. -1 on failure.
     */
    int write_json_file(const std::string &file_path, const jsoncons::ojson &d)
    {
        std::string json;
        // Convert json object to a string.
        try
        {
            jsoncons::json_options options;
            options.object_array_line_splits(jsoncons::line_split_kind::multi_line);
            options.spaces_around_comma(jsoncons::spaces_option::no_spaces);
            std::ostringstream os;
            os << jsoncons::pretty_print(d, options);
            json = os.str();
            os.clear();
        }
        catch (const std::exception &e)
        {
            std::cerr << "Converting json to string failed. " << file_path << std::endl;
            return -1;
        }

        // O_TRUNC flag is used to trucate existing content from the file.
        const int fd = open(file_path.data(), O_CREAT | O_RDWR | O_TRUNC, FILE_PERMS);
        if (fd == -1 || write(fd, json.data(), json.size()) == -1)
        {
            std::cerr << "Writing file failed. " << file_path << std::endl;
            if (fd != -1)
                close(fd);
            return -1;
        }
        close(fd);
        return 0;
    }

} // namespace conf
