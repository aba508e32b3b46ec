#include "cbfmcs_cpp/subarray/ChannelLinkDistributor.hpp"
#include <cmath>

namespace cbfmcs_cpp {
namespace subarray {

ChannelLinkDistributor::ChannelLinkDistributor(unsigned num_links)
    : _num_links(num_links)
{
    if (_num_links == 0)
    {
        throw std::runtime_error("At least one output link is required");
    }
}

ChannelLinkDistributor::~ChannelLinkDistributor()
{
}

FspOutputLinks ChannelLinkDistributor::distribute(FspConfiguration const& fsp,
    ScanConfiguration const& config) const
{
    double const bandwidth = constants::frequency_slice_bw / std::pow(2.0, fsp.zoom_factor);
    double next_channel_start;
    if (fsp.zoom_factor == 0)
    {
        next_channel_start = frequency_slice_start(config.frequency_band, fsp.frequency_slice_id,
            config.band_5_tuning, config.frequency_band_offset_stream1,
            config.frequency_band_offset_stream2);
    }
    else
    {
        next_channel_start = fsp.zoom_window_tuning * 1e3 - bandwidth / 2.0;
    }

    std::vector<OutputLink> links(_num_links);
    for (unsigned ii = 0; ii < _num_links; ++ii)
    {
        links[ii].link_id = static_cast<int>(ii) + 1;
    }

    std::size_t cursor = 0;
    int const per_group = static_cast<int>(constants::channels_per_group);
    for (unsigned group = 0; group < constants::num_channel_groups; ++group)
    {
        int factor = 0;
        if (group < fsp.channel_averaging_map.size())
        {
            factor = fsp.channel_averaging_map[group].second;
        }
        if (factor == 0)
        {
            next_channel_start += bandwidth / constants::num_channel_groups;
            continue;
        }
        double const channel_bw = bandwidth / constants::num_fine_channels * factor;
        int const first = static_cast<int>(group) * per_group + 1;
        for (int channel_id = first; channel_id < first + per_group; channel_id += factor)
        {
            OutputChannel channel;
            channel.channel_id = channel_id;
            channel.bandwidth = static_cast<long>(channel_bw);
            channel.centre_frequency = static_cast<long>(next_channel_start + channel_bw / 2.0);
            links[cursor % _num_links].channels.push_back(channel);
            ++cursor;
            next_channel_start += channel_bw;
        }
    }

    FspOutputLinks result;
    result.fsp_id = fsp.fsp_id;
    result.frequency_slice_id = fsp.frequency_slice_id;
    for (auto& link: links)
    {
        if (!link.channels.empty())
        {
            result.links.push_back(std::move(link));
        }
    }
    BOOST_LOG_TRIVIAL(debug) << "FSP " << fsp.fsp_id << ": " << cursor << " output channels on "
                             << result.links.size() << " links";
    return result;
}

boost::property_tree::ptree ChannelLinkDistributor::to_ptree(std::string const& config_id,
    std::vector<FspOutputLinks> const& links)
{
    using boost::property_tree::ptree;
    ptree root;
    root.put("config_id", config_id);
    ptree fsp_list;
    for (auto const& fsp: links)
    {
        ptree fsp_node;
        fsp_node.put("fsp_id", fsp.fsp_id);
        fsp_node.put("frequency_slice_id", fsp.frequency_slice_id);
        ptree link_list;
        for (auto const& link: fsp.links)
        {
            ptree link_node;
            link_node.put("link_id", link.link_id);
            ptree channel_list;
            for (auto const& channel: link.channels)
            {
                ptree channel_node;
                channel_node.put("chan_id", channel.channel_id);
                channel_node.put("bw", channel.bandwidth);
                channel_node.put("cf", channel.centre_frequency);
                channel_list.push_back(std::make_pair("", channel_node));
            }
            link_node.add_child("channel", channel_list);
            link_list.push_back(std::make_pair("", link_node));
        }
        fsp_node.add_child("cbf_out_link", link_list);
        fsp_list.push_back(std::make_pair("", fsp_node));
    }
    root.add_child("fsp", fsp_list);
    return root;
}

} //namespace subarray
} //namespace cbfmcs_cpp
