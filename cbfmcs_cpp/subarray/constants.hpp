#ifndef CBFMCS_CPP_SUBARRAY_CONSTANTS_HPP
#define CBFMCS_CPP_SUBARRAY_CONSTANTS_HPP

#include <cstddef>

namespace cbfmcs_cpp {
namespace subarray {
namespace constants {

// Frequency slice geometry
static double const frequency_slice_bw = 200.0e6; // Hz
static double const band_5_stream_bw = 2.5e9; // Hz
static double const max_stream_offset = frequency_slice_bw / 2.0; // Hz

// Correlator output
static unsigned const num_fine_channels = 14880;
static unsigned const num_channel_groups = 20;
static unsigned const channels_per_group = num_fine_channels / num_channel_groups;
static unsigned const num_output_links = 80;
static unsigned const max_zoom_factor = 6;
static unsigned const min_integration_factor = 1;
static unsigned const max_integration_multiple = 10;

// Beam and window capacities
static std::size_t const max_search_windows = 2;
static std::size_t const max_search_beams = 192;
static int const max_search_beam_id = 1500;
static std::size_t const max_timing_beams = 16;
static int const max_timing_beam_id = 16;

// VCC sample rate generation
static double const delta_f = 1800.0; // Hz
static double const vcc_oversampling_factor = 10.0 / 9.0;

} //namespace constants
} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_CONSTANTS_HPP
