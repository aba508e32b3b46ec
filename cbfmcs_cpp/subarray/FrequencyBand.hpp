#ifndef CBFMCS_CPP_SUBARRAY_FREQUENCYBAND_HPP
#define CBFMCS_CPP_SUBARRAY_FREQUENCYBAND_HPP

#include "cbfmcs_cpp/common.hpp"
#include <boost/optional.hpp>

namespace cbfmcs_cpp {
namespace subarray {

enum class FrequencyBand
{
    BAND_1 = 0,
    BAND_2,
    BAND_3,
    BAND_4,
    BAND_5A,
    BAND_5B
};

/**
 * @brief      Static description of one receiver band.
 *
 * @detail     For bands 5a and 5b the range is the permitted
 *             window for the centre of each 2.5 GHz stream.
 */
struct BandParameters
{
    std::string name;
    double start; // Hz
    double stop; // Hz
    int num_frequency_slices;
    double base_dish_sample_rate; // Hz
    double sample_rate_const;
    int total_num_fs;
    int samples_per_frame;
};

boost::optional<FrequencyBand> parse_frequency_band(std::string const& name);

std::string to_string(FrequencyBand band);

bool is_band_5(FrequencyBand band);

BandParameters const& band_parameters(FrequencyBand band);

/**
 * @brief      Sample rate of a dish digitiser in the given band.
 *
 * @param      k     The frequency offset index of the receptor.
 */
double dish_sample_rate(FrequencyBand band, int k);

/**
 * @brief      Sample rate of one frequency slice produced by a VCC.
 */
double fs_sample_rate(FrequencyBand band, int k);

/**
 * @brief      Start frequency of a frequency slice in Hz.
 *
 * @detail     For bands 1-4 slices are counted up from the band start.
 *             For band 5 slices 1-13 belong to stream 1 and 14-26 to
 *             stream 2, each counted up from the lower edge of its stream.
 */
double frequency_slice_start(FrequencyBand band,
    int frequency_slice_id,
    std::pair<double, double> const& band_5_tuning,
    double offset_stream1,
    double offset_stream2);

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_FREQUENCYBAND_HPP
