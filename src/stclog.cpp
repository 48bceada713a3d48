#include "pchheader.hpp"
#include "conf.hpp"
#include "stclog.hpp"

namespace stclog
{
    constexpr size_t BYTES_PER_MB = 1024 * 1024;

    /**
     * Single line records: "2024-06-11 08:15:02.117 [inf][stc:4711] message".
     * The number after "stc:" is the logging thread id.
     */
    class stc_formatter
    {
    public:
        static plog::util::nstring header()
        {
            return plog::util::nstring();
        }

        static const char *severity_tag(const plog::Severity severity)
        {
            switch (severity)
            {
            case plog::Severity::fatal:
                return "fat";
            case plog::Severity::error:
                return "err";
            case plog::Severity::warning:
                return "wrn";
            case plog::Severity::info:
                return "inf";
            case plog::Severity::debug:
                return "dbg";
            default:
                return "ver";
            }
        }

        static plog::util::nstring format(const plog::Record &record)
        {
            tm t;
            plog::util::localtime_s(&t, &record.getTime().time);

            plog::util::nostringstream ss;
            ss << std::put_time(&t, PLOG_NSTR("%Y-%m-%d %H:%M:%S")) << PLOG_NSTR(".")
               << std::setfill(PLOG_NSTR('0')) << std::setw(3) << record.getTime().millitm << PLOG_NSTR(" ");
            ss << PLOG_NSTR("[") << severity_tag(record.getSeverity()) << PLOG_NSTR("][stc:") << record.getTid() << PLOG_NSTR("] ");
            ss << record.getMessage() << PLOG_NSTR("\n");
            return ss.str();
        }
    };

    plog::Severity to_plog_severity(const conf::LOG_SEVERITY level)
    {
        switch (level)
        {
        case conf::LOG_SEVERITY::DEBUG:
            return plog::Severity::debug;
        case conf::LOG_SEVERITY::INFO:
            return plog::Severity::info;
        case conf::LOG_SEVERITY::WARN:
            return plog::Severity::warning;
        default:
            return plog::Severity::error;
        }
    }

    /**
     * Sets up plog with the console and/or rolling file appenders enabled in the log config.
     * conf::init() must have succeeded before this. Rolled files are kept next to stridecore.log in the log dir.
     */
    void init()
    {
        const conf::log_config &log = conf::cfg.log;
        const std::string log_file = conf::ctx.log_dir + "/stridecore.log";

        static plog::RollingFileAppender<stc_formatter> file_appender(log_file.c_str(),
                                                                      log.max_mbytes_per_file * BYTES_PER_MB,
                                                                      log.max_file_count);
        static plog::ConsoleAppender<stc_formatter> console_appender;

        plog::Logger<0> &logger = plog::init(to_plog_severity(log.log_level_type));

        if (log.loggers.count("console") == 1)
            logger.addAppender(&console_appender);

        if (log.loggers.count("file") == 1)
            logger.addAppender(&file_appender);
    }
} // namespace stclog
