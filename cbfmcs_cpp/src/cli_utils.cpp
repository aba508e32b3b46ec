#include "cbfmcs_cpp/cli_utils.hpp"
#include <boost/algorithm/string/case_conv.hpp>

namespace cbfmcs_cpp {

    boost::log::trivial::severity_level parse_log_level(std::string const& level)
    {
        using namespace boost::log;
        std::string const name = boost::algorithm::to_lower_copy(level);
        if (name == "debug")
        {
            return trivial::debug;
        }
        else if (name == "info")
        {
            return trivial::info;
        }
        else if (name == "warning")
        {
            return trivial::warning;
        }
        else if (name == "error")
        {
            return trivial::error;
        }
        throw std::invalid_argument(std::string("Unknown log level '") + level
            + "', expected one of debug, info, warning, error");
    }

    void set_log_level(std::string const& level)
    {
        using namespace boost::log;
        core::get()->set_filter(trivial::severity >= parse_log_level(level));
    }

} //namespace cbfmcs_cpp
