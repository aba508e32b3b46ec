#ifndef CBFMCS_CPP_CLI_UTILS_HPP
#define CBFMCS_CPP_CLI_UTILS_HPP

#include "cbfmcs_cpp/common.hpp"

namespace cbfmcs_cpp {

    /**
     * @brief      Convert a log level name into a Boost.Log severity.
     *
     * @param[in]  level  One of [debug, info, warning, error], case insensitive.
     *
     * @note       Throws std::invalid_argument for any other name.
     */
    boost::log::trivial::severity_level parse_log_level(std::string const& level);

    /**
     * @brief      Sets the log level for boost logging.
     *
     * @param[in]  level  The desired log level as a string
     *                    [debug, info, warning, error].
     */
    void set_log_level(std::string const& level);

} //namespace cbfmcs_cpp
#endif //CBFMCS_CPP_CLI_UTILS_HPP
