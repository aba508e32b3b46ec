#ifndef CBFMCS_CPP_SUBARRAY_SUBARRAYCONTROLSERVER_HPP
#define CBFMCS_CPP_SUBARRAY_SUBARRAYCONTROLSERVER_HPP

#include "cbfmcs_cpp/subarray/Subarray.hpp"
#include "cbfmcs_cpp/common.hpp"
#include <boost/asio.hpp>
#include <boost/property_tree/ptree.hpp>
#include <atomic>
#include <thread>

namespace cbfmcs_cpp {
namespace subarray {

/**
 * @brief      Serves the lifecycle commands and attributes of a
 *             subarray on a UNIX stream socket.
 *
 * @detail     Each connection carries one newline terminated JSON
 *             request and receives one JSON response before the server
 *             closes it. Requests have the form
 *
 *             {"command": "scan", "argument": 12}
 *             {"command": "read", "attribute": "obsState"}
 *
 *             and responses the form
 *
 *             {"response": "success", "result_code": "OK", "message": "..."}
 *
 *             with an additional "value" for reads. A request that cannot
 *             be parsed or names an unknown command gets a "fail" response.
 */
class SubarrayControlServer
{
public:
    SubarrayControlServer(std::string const& socket_name, Subarray& subarray);
    SubarrayControlServer(SubarrayControlServer const&) = delete;
    ~SubarrayControlServer();

    void start();
    void stop();

    /**
     * @brief      Execute one request and return its response.
     */
    std::string handle(std::string const& request);

private:
    typedef boost::property_tree::ptree ptree;

    void setup();
    void listen();
    bool has_message();
    void serve();
    ptree execute(ptree const& request);
    ptree read(std::string const& attribute) const;

private:
    std::string _socket_name;
    Subarray& _subarray;
    std::atomic<bool> _stop;
    boost::asio::io_service _io_service;
    std::unique_ptr<boost::asio::local::stream_protocol::acceptor> _acceptor;
    std::unique_ptr<boost::asio::local::stream_protocol::socket> _socket;
    std::thread _listener_thread;
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_SUBARRAYCONTROLSERVER_HPP
