#ifndef CBFMCS_CPP_SUBARRAY_CHANNELLINKDISTRIBUTOR_HPP
#define CBFMCS_CPP_SUBARRAY_CHANNELLINKDISTRIBUTOR_HPP

#include "cbfmcs_cpp/subarray/ScanConfiguration.hpp"
#include "cbfmcs_cpp/subarray/constants.hpp"

namespace cbfmcs_cpp {
namespace subarray {

struct OutputChannel
{
    int channel_id;
    long bandwidth; // Hz
    long centre_frequency; // Hz
};

struct OutputLink
{
    int link_id;
    std::vector<OutputChannel> channels;
};

struct FspOutputLinks
{
    int fsp_id;
    int frequency_slice_id;
    std::vector<OutputLink> links;
};

/**
 * @brief      Places the averaged fine channels of a correlator FSP
 *             onto output links.
 *
 * @detail     The slice bandwidth (200 MHz / 2^zoom) is divided into
 *             14880 fine channels in 20 groups of 744. A group with
 *             averaging factor 0 is dropped, otherwise every factor-th
 *             channel survives with a bandwidth of factor fine channels.
 *             Surviving channels are dealt to links round robin. Only
 *             links that carry at least one channel are reported.
 */
class ChannelLinkDistributor
{
public:
    explicit ChannelLinkDistributor(unsigned num_links = constants::num_output_links);
    ~ChannelLinkDistributor();

    FspOutputLinks distribute(FspConfiguration const& fsp, ScanConfiguration const& config) const;

    /**
     * @brief      Serialise the link layout of every FSP of a configuration.
     */
    static boost::property_tree::ptree to_ptree(std::string const& config_id,
        std::vector<FspOutputLinks> const& links);

private:
    unsigned _num_links;
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_CHANNELLINKDISTRIBUTOR_HPP
