/**
    Entry point for stridecore
**/

#include "pchheader.hpp"
#include "util/version.hpp"
#include "util/util.hpp"
#include "conf.hpp"
#include "crypto.hpp"
#include "stclog.hpp"
#include "ledger/ledger.hpp"
#include "oracle/attestation_service.hpp"
#include "oracle/mileage_source.hpp"

constexpr uint64_t EVENT_IDLE_WAIT = 200; // ms

std::unique_ptr<ledger::settlement_ledger> settlement;
std::unique_ptr<oracle::attestation_service> attestation;
volatile sig_atomic_t exit_signal = 0;

/**
 * Parses CLI args and extracts stridecore command and parameters given.
 * stridecore command line accepts command and the node directory(optional)
 */
int parse_cmd(int argc, char **argv)
{
    if (argc > 1) //We get working dir as an arg anyway. So we need to check for >1 args.
    {
        // We populate the global node ctx with the detected command.
        conf::ctx.command = argv[1];

        // For run/new/rekey, node directory argument must be specified.

        if (conf::ctx.command == "run" || conf::ctx.command == "new" || conf::ctx.command == "rekey")
        {
            if (argc != 3)
            {
                std::cerr << "Node directory not specified.\n";
            }
            else
            {
                // We inform the conf subsystem to populate the node directory context values
                // based on the directory argument from the command line.
                conf::set_dir_paths(argv[0], argv[2]);

                return 0;
            }
        }
        else if (conf::ctx.command == "version")
        {
            if (argc == 2)
                return 0;
        }
    }

    // If all extractions fail display help message.

    std::cerr << "Arguments mismatch.\n";
    std::cout << "Usage:\n";
    std::cout << "stridecore version\n";
    std::cout << "stridecore <command> <node dir> (command = run | new | rekey)\n";
    std::cout << "Example: stridecore run ~/mynode\n";

    return -1;
}

/**
 * Performs any cleanup on graceful application termination.
 */
void deinit()
{
    if (attestation)
        attestation->deinit();
    if (settlement)
        settlement->deinit();
    conf::deinit();
}

void sig_exit_handler(int signum)
{
    exit_signal = signum;
}

void segfault_handler(int signum)
{
    std::cerr << boost::stacktrace::stacktrace() << "\n";
    exit(SIGABRT);
}

/**
 * Global exception handler for std exceptions.
 */
void std_terminate() noexcept
{
    std::exception_ptr exptr = std::current_exception();
    if (exptr != 0)
    {
        try
        {
            std::rethrow_exception(exptr);
        }
        catch (std::exception &ex)
        {
            LOG_ERROR << "std error: " << ex.what();
        }
        catch (...)
        {
            LOG_ERROR << "std error: Terminated due to unknown exception";
        }
    }
    else
    {
        LOG_ERROR << "std error: Terminated due to unknown reason";
    }

    LOG_ERROR << boost::stacktrace::stacktrace();

    exit(1);
}

/**
 * Writes a settlement fact to the log. This is the only consumer of ledger events inside the node.
 */
void log_ledger_event(const ledger::ledger_event &ev)
{
    if (std::holds_alternative<ledger::challenge_created_event>(ev))
    {
        const auto &e = std::get<ledger::challenge_created_event>(ev);
        LOG_INFO << "Event: challenge " << e.challenge_id << " created by " << util::to_hex(e.creator)
                 << " [" << e.start_time << "-" << e.end_time << "] stake " << e.stake_amount;
    }
    else if (std::holds_alternative<ledger::participant_joined_event>(ev))
    {
        const auto &e = std::get<ledger::participant_joined_event>(ev);
        LOG_INFO << "Event: " << util::to_hex(e.identity) << " joined challenge " << e.challenge_id
                 << " (" << e.correlation_id << ") stake " << e.stake;
    }
    else if (std::holds_alternative<ledger::challenge_finalized_event>(ev))
    {
        const auto &e = std::get<ledger::challenge_finalized_event>(ev);
        LOG_INFO << "Event: challenge " << e.challenge_id << " finalized. Winner " << util::to_hex(e.winner)
                 << " result " << util::to_hex(e.result_hash);
    }
    else if (std::holds_alternative<ledger::challenge_completed_event>(ev))
    {
        const auto &e = std::get<ledger::challenge_completed_event>(ev);
        LOG_INFO << "Event: challenge " << e.challenge_id << " completed. Prize " << e.prize << " paid to " << util::to_hex(e.winner);
    }
    else if (std::holds_alternative<ledger::challenge_cancelled_event>(ev))
    {
        LOG_INFO << "Event: challenge " << std::get<ledger::challenge_cancelled_event>(ev).challenge_id << " cancelled.";
    }
    else if (std::holds_alternative<ledger::stake_withdrawn_event>(ev))
    {
        const auto &e = std::get<ledger::stake_withdrawn_event>(ev);
        LOG_INFO << "Event: " << util::to_hex(e.identity) << " withdrew " << e.amount << " from challenge " << e.challenge_id;
    }
    else if (std::holds_alternative<ledger::emergency_withdrawal_event>(ev))
    {
        const auto &e = std::get<ledger::emergency_withdrawal_event>(ev);
        LOG_INFO << "Event: " << util::to_hex(e.identity) << " emergency withdrew " << e.amount << " from challenge " << e.challenge_id;
    }
    else
    {
        const auto &e = std::get<ledger::attester_key_updated_event>(ev);
        LOG_INFO << "Event: attester key updated to " << util::to_hex(e.new_key) << " (v" << e.version << ")";
    }
}

/**
 * Opens the settlement ledger and starts the attestation service on the loaded node directory.
 */
int init_node()
{
    settlement = std::make_unique<ledger::settlement_ledger>();
    if (settlement->init(conf::ctx.data_dir + "/" + ledger::LEDGER_DB, conf::cfg.ledger.attester_key) == -1)
        return -1;

    for (uint64_t id = 0; id < settlement->challenge_count(); id++)
    {
        ledger::CHALLENGE_STATE state;
        if (settlement->effective_state(id, state) == ledger::OK)
            LOG_DEBUG << "Challenge " << id << ": " << ledger::state_to_string(state);
    }

    const std::string mileage_path = conf::cfg.oracle.mileage_file[0] == '/'
                                         ? conf::cfg.oracle.mileage_file
                                         : conf::ctx.node_dir + "/" + conf::cfg.oracle.mileage_file;

    attestation = std::make_unique<oracle::attestation_service>(
        *settlement, std::make_shared<oracle::file_mileage_source>(mileage_path), conf::cfg.node.private_key);
    if (attestation->init(conf::ctx.data_dir + "/" + oracle::ORACLE_DB, conf::cfg.oracle.sync_interval, conf::cfg.oracle.fetch_timeout) == -1)
        return -1;

    attestation->start_sweep();
    return 0;
}

int main(int argc, char **argv)
{
    // Register exception and segfault handlers.
    std::set_terminate(&std_terminate);
    signal(SIGSEGV, &segfault_handler);
    signal(SIGABRT, &segfault_handler);

    // Extract the CLI args
    // This call will populate conf::ctx
    if (parse_cmd(argc, argv) != 0)
        return -1;

    if (conf::ctx.command == "version")
    {
        // Print the version
        std::cout << "stridecore " << version::STC_VERSION << " (ledger version " << version::LEDGER_VERSION << ")" << std::endl;
    }
    else
    {
        // This block is about node operations (new/rekey/run)
        // All the node operations will be executed on the node directory specified
        // in the command line args. 'parse_cmd()' above takes care of populating the contexual directory paths.

        // For any node opreation to execute, we should init the crypto subsystem.
        if (crypto::init() != 0)
            return -1;

        if (conf::ctx.command == "new")
        {
            // This will create a new node directory with all the required files.
            if (conf::create_node_dir() != 0)
                return -1;
        }
        else
        {
            if (conf::ctx.command == "rekey")
            {
                // This will generate new signing keys for the node.
                if (conf::rekey() != 0)
                    return -1;
            }
            else if (conf::ctx.command == "run")
            {
                if (conf::init() != 0)
                    return -1;

                stclog::init();

                LOG_INFO << "stridecore " << version::STC_VERSION;
                LOG_INFO << "Public key: " << conf::cfg.node.public_key_hex;
                LOG_INFO << "Attester key: " << conf::cfg.ledger.attester_key_hex;

                if (init_node() == -1)
                {
                    deinit();
                    return -1;
                }

                // After initializing primary subsystems, register the exit handler.
                signal(SIGINT, &sig_exit_handler);
                signal(SIGTERM, &sig_exit_handler);

                // Drain ledger events until we are signalled to exit.
                while (exit_signal == 0)
                {
                    ledger::ledger_event ev;
                    if (settlement->try_pop_event(ev))
                        log_ledger_event(ev);
                    else
                        util::sleep(EVENT_IDLE_WAIT);
                }

                LOG_WARNING << "Interrupt signal (" << exit_signal << ") received.";
                deinit();
            }
        }
    }

    std::cout << "stridecore exited normally.\n";
    return 0;
}
