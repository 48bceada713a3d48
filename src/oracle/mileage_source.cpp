#include "../pchheader.hpp"
#include "../util/util.hpp"
#include "mileage_source.hpp"

namespace oracle
{
    file_mileage_source::file_mileage_source(std::string_view file_path) : file_path(file_path)
    {
    }

    int file_mileage_source::fetch_mileage(std::string_view identity, std::string_view correlation_id,
                                           const uint64_t window_start, const uint64_t window_end, mileage_reading &reading)
    {
        std::string buf;
        if (util::read_file(file_path, buf) == -1)
        {
            LOG_ERROR << "Error reading mileage file " << file_path;
            return -1;
        }

        try
        {
            const jsoncons::ojson d = jsoncons::ojson::parse(buf, jsoncons::strict_json_parsing());
            const std::string key(correlation_id);

            reading = mileage_reading{};
            if (!d.contains(key))
                return 0;

            const jsoncons::ojson &entry = d[key];
            if (entry.is_object())
            {
                reading.miles = entry["miles"].as<double>();
                reading.sample_count = entry.get_value_or<uint64_t>("samples", 1);
            }
            else
            {
                reading.miles = entry.as<double>();
                reading.sample_count = 1;
            }
        }
        catch (const std::exception &e)
        {
            LOG_ERROR << "Invalid mileage file format. " << e.what();
            return -1;
        }

        LOG_DEBUG << "Mileage for " << correlation_id << " in [" << window_start << "," << window_end << "]: " << reading.miles;
        return 0;
    }

} // namespace oracle
