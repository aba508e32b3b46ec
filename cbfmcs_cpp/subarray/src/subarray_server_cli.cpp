#include "cbfmcs_cpp/subarray/ConfigParser.hpp"
#include "cbfmcs_cpp/subarray/SimulatedFleetGateway.hpp"
#include "cbfmcs_cpp/subarray/Subarray.hpp"
#include "cbfmcs_cpp/subarray/SubarrayConfig.hpp"
#include "cbfmcs_cpp/subarray/SubarrayControlServer.hpp"
#include "cbfmcs_cpp/cli_utils.hpp"
#include "cbfmcs_cpp/common.hpp"
#include "boost/program_options.hpp"
#include <csignal>
#include <chrono>
#include <thread>

using namespace cbfmcs_cpp;

namespace
{
  const size_t ERROR_IN_COMMAND_LINE = 1;
  const size_t SUCCESS = 0;
  const size_t ERROR_UNHANDLED_EXCEPTION = 2;

  volatile std::sig_atomic_t stop_requested = 0;
} // namespace


namespace detail
{
    void SignalHandler(int)
    {
        stop_requested = 1;
    }
}

int main(int argc, char** argv)
{
    try
    {
        std::string config_filename;
        std::string socket_name;
        /*
         * Define and parse the program options
         */
        namespace po = boost::program_options;
        po::options_description desc("Options");
        desc.add_options()
        ("help,h", "Print help messages")
        ("config,c", po::value<std::string>(&config_filename)->required(),
            "The XML file describing the subarray, its fleet and its receptor map")
        ("socket,s", po::value<std::string>(&socket_name)
            ->default_value("/tmp/cbfmcs_subarray.sock"),
            "The name of the control socket serving subarray commands")
        ("log_level", po::value<std::string>()
            ->default_value("info")
            ->notifier([](std::string level)
                {
                    try
                    {
                        set_log_level(level);
                    }
                    catch (std::invalid_argument&)
                    {
                        throw po::validation_error(po::validation_error::invalid_option_value,
                            "log_level", level);
                    }
                }),
            "The logging level to use (debug, info, warning, error)");

        /* Catch Error and program description */
        po::variables_map vm;
        try
        {
            po::store(po::parse_command_line(argc, argv, desc), vm);
            if ( vm.count("help")  )
            {
                std::cout << "subarray_server -- run a CBF subarray over a simulated fleet, "
                << "controlled through a UNIX socket" << std::endl << desc << std::endl;
                return SUCCESS;
            }
            po::notify(vm);
        }
        catch(po::error& e)
        {
            std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
            std::cerr << desc << std::endl;
            return ERROR_IN_COMMAND_LINE;
        }

       /* Application Code */

        subarray::SubarrayConfig config;
        subarray::parse_xml_config(config_filename, config);

        std::signal(SIGINT, detail::SignalHandler);
        std::signal(SIGTERM, detail::SignalHandler);

        subarray::SimulatedFleetGateway fleet;
        fleet.populate(config);
        subarray::Subarray subarray(config, fleet);
        subarray::SubarrayControlServer server(socket_name, subarray);
        server.start();
        while (!stop_requested)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        BOOST_LOG_TRIVIAL(info) << "Shutdown requested";
        server.stop();

      /* End Application Code */

    }
    catch(std::exception& e)
    {
        std::cerr << "Unhandled Exception reached the top of main: "
        << e.what() << ", application will now exit" << std::endl;
        return ERROR_UNHANDLED_EXCEPTION;
    }
    return SUCCESS;
}
