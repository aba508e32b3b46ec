#include "cbfmcs_cpp/subarray/ScanConfiguration.hpp"
#include <boost/property_tree/json_parser.hpp>

namespace cbfmcs_cpp {
namespace subarray {
namespace json {

    boost::property_tree::ptree parse(std::string const& text)
    {
        boost::property_tree::ptree tree;
        std::stringstream stream(text);
        boost::property_tree::json_parser::read_json(stream, tree);
        return tree;
    }

    std::string serialize(boost::property_tree::ptree const& tree)
    {
        std::stringstream stream;
        boost::property_tree::json_parser::write_json(stream, tree, false);
        std::string text = stream.str();
        // write_json terminates its output with a newline
        if (!text.empty() && text.back() == '\n')
        {
            text.pop_back();
        }
        return text;
    }

} //namespace json

std::string ScanConfiguration::to_json() const
{
    return json::serialize(document);
}

} //namespace subarray
} //namespace cbfmcs_cpp
