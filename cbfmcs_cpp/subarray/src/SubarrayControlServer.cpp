#include "cbfmcs_cpp/subarray/SubarrayControlServer.hpp"
#include "cbfmcs_cpp/subarray/ScanConfiguration.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <unistd.h>
#include <chrono>

namespace cbfmcs_cpp {
namespace subarray {
namespace detail {

    typedef boost::property_tree::ptree ptree;

    ptree response(CommandResult const& result)
    {
        ptree tree;
        tree.put("response", result.ok() ? "success" : "fail");
        tree.put("result_code", to_string(result.code));
        tree.put("message", result.message);
        return tree;
    }

    ptree failure(std::string const& message)
    {
        ptree tree;
        tree.put("response", "fail");
        tree.put("message", message);
        return tree;
    }

    std::vector<int> receptor_argument(ptree const& request)
    {
        auto argument = request.get_child_optional("argument");
        if (!argument)
        {
            throw std::runtime_error("'argument' not given");
        }
        return json::values<int>(*argument, "argument");
    }

    ptree status_values(std::vector<NodeStatus> const& status, bool health)
    {
        std::vector<std::string> values;
        for (auto const& entry: status)
        {
            values.push_back(health ? entry.health_state : entry.state);
        }
        return json::array(values);
    }

} //namespace detail

SubarrayControlServer::SubarrayControlServer(std::string const& socket_name, Subarray& subarray)
    : _socket_name(socket_name)
    , _subarray(subarray)
    , _stop(false)
{
}

SubarrayControlServer::~SubarrayControlServer()
{
    stop();
    if (_socket && _socket->is_open())
    {
        BOOST_LOG_TRIVIAL(debug) << "Closing control socket";
        boost::system::error_code ec;
        _socket->close(ec);
    }
}

void SubarrayControlServer::setup()
{
    ::unlink(_socket_name.c_str()); // Remove previous binding.
    boost::asio::local::stream_protocol::endpoint ep(_socket_name);
    _acceptor.reset(new boost::asio::local::stream_protocol::acceptor(_io_service, ep));
    _acceptor->non_blocking(true);
    _socket.reset(new boost::asio::local::stream_protocol::socket(_io_service));
}

void SubarrayControlServer::start()
{
    BOOST_LOG_TRIVIAL(info) << "Starting SubarrayControlServer for subarray "
                            << _subarray.subarray_id() << " (listening on socket '"
                            << _socket_name << "')";
    _stop = false;
    setup();
    _listener_thread = std::thread(&SubarrayControlServer::listen, this);
}

void SubarrayControlServer::stop()
{
    if (!_listener_thread.joinable())
    {
        return;
    }
    BOOST_LOG_TRIVIAL(info) << "Stopping SubarrayControlServer (listening on socket '"
                            << _socket_name << "')";
    _stop = true;
    _listener_thread.join();
    boost::system::error_code ec;
    _acceptor->close(ec);
    ::unlink(_socket_name.c_str());
}

void SubarrayControlServer::listen()
{
    BOOST_LOG_TRIVIAL(debug) << "Listening for control messages...";
    while (!_stop)
    {
        if (has_message())
        {
            try
            {
                serve();
            }
            catch (std::exception& e)
            {
                BOOST_LOG_TRIVIAL(error) << "Error serving control message: " << e.what();
            }
            boost::system::error_code ec;
            _socket->close(ec);
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    BOOST_LOG_TRIVIAL(debug) << "Control message listening loop complete.";
}

bool SubarrayControlServer::has_message()
{
    boost::system::error_code ec;
    _acceptor->accept(*_socket, ec);
    if (ec)
    {
        if (ec != boost::asio::error::would_block && ec != boost::asio::error::try_again)
        {
            BOOST_LOG_TRIVIAL(error) << "Error on accept: " << ec.message();
        }
        return false;
    }
    return true;
}

void SubarrayControlServer::serve()
{
    boost::asio::streambuf buffer;
    boost::system::error_code ec;
    boost::asio::read_until(*_socket, buffer, '\n', ec);
    if (ec && ec != boost::asio::error::eof)
    {
        throw std::runtime_error(std::string("Error on read: ") + ec.message());
    }
    std::istream stream(&buffer);
    std::string request;
    std::getline(stream, request);
    BOOST_LOG_TRIVIAL(debug) << "Received string: " << request;
    std::string const reply = handle(request) + "\n";
    boost::asio::write(*_socket, boost::asio::buffer(reply), ec);
    if (ec)
    {
        throw std::runtime_error(std::string("Error on write: ") + ec.message());
    }
}

std::string SubarrayControlServer::handle(std::string const& request)
{
    ptree reply;
    try
    {
        reply = execute(json::parse(request));
    }
    catch (std::exception& e)
    {
        BOOST_LOG_TRIVIAL(error) << "Bad control message: " << e.what();
        reply = detail::failure(e.what());
    }
    return json::serialize(reply);
}

SubarrayControlServer::ptree SubarrayControlServer::execute(ptree const& request)
{
    std::string const command = request.get<std::string>("command");
    BOOST_LOG_TRIVIAL(info) << "Received command: '" << command << "'";
    if (command == "read")
    {
        return read(request.get<std::string>("attribute"));
    }
    else if (command == "add_receptors")
    {
        return detail::response(_subarray.add_receptors(detail::receptor_argument(request)));
    }
    else if (command == "remove_receptors")
    {
        return detail::response(_subarray.remove_receptors(detail::receptor_argument(request)));
    }
    else if (command == "remove_all_receptors")
    {
        return detail::response(_subarray.remove_all_receptors());
    }
    else if (command == "configure_scan")
    {
        ptree const& argument = request.get_child("argument");
        // The configuration may be embedded as an object or as a string
        std::string const configuration = argument.empty() ? argument.data() : json::serialize(argument);
        return detail::response(_subarray.configure_scan(configuration));
    }
    else if (command == "scan")
    {
        return detail::response(_subarray.scan(request.get<int>("argument")));
    }
    else if (command == "end_scan")
    {
        return detail::response(_subarray.end_scan());
    }
    else if (command == "go_to_idle")
    {
        return detail::response(_subarray.go_to_idle());
    }
    else if (command == "abort")
    {
        return detail::response(_subarray.abort());
    }
    else if (command == "obs_reset")
    {
        return detail::response(_subarray.obs_reset());
    }
    else if (command == "restart")
    {
        return detail::response(_subarray.restart());
    }
    throw std::runtime_error(std::string("Unknown command '") + command + "'");
}

SubarrayControlServer::ptree SubarrayControlServer::read(std::string const& attribute) const
{
    ptree reply = detail::response(CommandResult{ResultCode::OK, attribute});
    if (attribute == "obsState")
    {
        reply.put("value", to_string(_subarray.obs_state()));
    }
    else if (attribute == "scanId")
    {
        reply.put("value", _subarray.scan_id());
    }
    else if (attribute == "configId")
    {
        reply.put("value", _subarray.config_id());
    }
    else if (attribute == "frequencyBand")
    {
        reply.put("value", _subarray.frequency_band());
    }
    else if (attribute == "receptors")
    {
        reply.add_child("value", json::array(_subarray.receptors()));
    }
    else if (attribute == "vccState")
    {
        reply.add_child("value", detail::status_values(_subarray.vcc_status(), false));
    }
    else if (attribute == "vccHealthState")
    {
        reply.add_child("value", detail::status_values(_subarray.vcc_status(), true));
    }
    else if (attribute == "fspState")
    {
        reply.add_child("value", detail::status_values(_subarray.fsp_status(), false));
    }
    else if (attribute == "fspHealthState")
    {
        reply.add_child("value", detail::status_values(_subarray.fsp_status(), true));
    }
    else if (attribute == "outputLinksDistribution")
    {
        reply.put("value", _subarray.output_links_distribution());
    }
    else
    {
        throw std::runtime_error(std::string("Unknown attribute '") + attribute + "'");
    }
    return reply;
}

} //namespace subarray
} //namespace cbfmcs_cpp
