#ifndef CBFMCS_CPP_SUBARRAY_SCANCONFIGURATION_HPP
#define CBFMCS_CPP_SUBARRAY_SCANCONFIGURATION_HPP

#include "cbfmcs_cpp/subarray/FrequencyBand.hpp"
#include "cbfmcs_cpp/subarray/FunctionMode.hpp"
#include "cbfmcs_cpp/common.hpp"
#include <boost/property_tree/ptree.hpp>

namespace cbfmcs_cpp {
namespace subarray {
namespace json {

    boost::property_tree::ptree parse(std::string const& text);

    std::string serialize(boost::property_tree::ptree const& tree);

    template <typename T>
    boost::property_tree::ptree array(std::vector<T> const& values)
    {
        boost::property_tree::ptree node;
        for (auto const& value: values)
        {
            boost::property_tree::ptree item;
            item.put_value(value);
            node.push_back(std::make_pair("", item));
        }
        return node;
    }

    /**
     * @brief      Read every element of an array node as T.
     *
     * @note       Throws std::invalid_argument naming the key if an
     *             element does not convert.
     */
    template <typename T>
    std::vector<T> values(boost::property_tree::ptree const& node, std::string const& key)
    {
        std::vector<T> result;
        for (auto const& item: node)
        {
            auto value = item.second.get_value_optional<T>();
            if (!value || !item.second.empty())
            {
                throw std::invalid_argument(std::string("'") + key + "' contains a malformed element");
            }
            result.push_back(*value);
        }
        return result;
    }

} //namespace json

/**
 * @brief      Configuration of one FSP for one function mode.
 *
 * @detail     The typed members are those the distributor acts on.
 *             The complete normalised entry is kept in document.
 */
struct FspConfiguration
{
    int fsp_id;
    FunctionMode function_mode;
    std::vector<int> receptors;
    int frequency_slice_id;
    int zoom_factor;
    double zoom_window_tuning; // kHz
    int integration_factor;
    int channel_offset;
    std::vector<std::pair<int, int>> channel_averaging_map;
    boost::property_tree::ptree document;
};

struct SearchWindowConfiguration
{
    int search_window_id;
    bool tdc_enable;
    boost::property_tree::ptree document;
};

/**
 * @brief      A validated and normalised scan configuration.
 */
struct ScanConfiguration
{
    std::string config_id;
    FrequencyBand frequency_band;
    std::pair<double, double> band_5_tuning; // GHz
    double frequency_band_offset_stream1; // Hz
    double frequency_band_offset_stream2; // Hz
    std::string delay_model_subscription_point;
    std::string jones_matrix_subscription_point;
    std::string beam_weights_subscription_point;
    std::string vis_destination_address_subscription_point;
    std::vector<SearchWindowConfiguration> search_windows;
    std::vector<FspConfiguration> fsp;
    boost::property_tree::ptree document;

    std::string to_json() const;
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_SCANCONFIGURATION_HPP
