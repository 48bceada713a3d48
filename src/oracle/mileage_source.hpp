#ifndef _STC_ORACLE_MILEAGE_SOURCE_
#define _STC_ORACLE_MILEAGE_SOURCE_

#include "../pchheader.hpp"

namespace oracle
{
    struct mileage_reading
    {
        double miles = 0;          // Total miles in the window. 0 when nothing was found.
        uint64_t sample_count = 0; // No. of activities the figure was built from.
    };

    /**
     * Activity data collaborator. Implementations manage their own access credentials and must be safe to call
     * from multiple threads. A call may be abandoned by the caller after its timeout, so implementations must
     * not rely on the caller being alive when they return.
     */
    class mileage_source
    {
    public:
        virtual ~mileage_source() = default;

        // Must override in child classes. Returns 0 on success (including "nothing found") and -1 on failure.
        virtual int fetch_mileage(std::string_view identity, std::string_view correlation_id,
                                  const uint64_t window_start, const uint64_t window_end, mileage_reading &reading) = 0;
    };

    /**
     * Reads mileage from a json file of the form {"<correlation id>": <miles>, ...}. A value may also be an object
     * {"miles": <miles>, "samples": <count>}. The file is re-read on every fetch so it can be edited while the node
     * is running. Ids missing from the file have 0 miles.
     */
    class file_mileage_source : public mileage_source
    {
    private:
        const std::string file_path;

    public:
        file_mileage_source(std::string_view file_path);

        int fetch_mileage(std::string_view identity, std::string_view correlation_id,
                          const uint64_t window_start, const uint64_t window_end, mileage_reading &reading);
    };

} // namespace oracle

#endif
