#include "cbfmcs_cpp/subarray/FrequencyBand.hpp"
#include "cbfmcs_cpp/subarray/constants.hpp"

namespace cbfmcs_cpp {
namespace subarray {
namespace detail {

    std::vector<BandParameters> const& band_table()
    {
        static std::vector<BandParameters> const table = {
            {"1",  0.35e9, 1.05e9,  4,  3960.0e6, 1.0, 20, 18},
            {"2",  0.95e9, 1.76e9,  5,  3960.0e6, 1.0, 20, 18},
            {"3",  1.65e9, 3.05e9,  7,  3168.0e6, 0.8, 20, 18},
            {"4",  2.80e9, 5.18e9,  12, 5940.0e6, 1.5, 30, 27},
            {"5a", 5.85e9, 7.25e9,  26, 5940.0e6, 1.5, 60, 27},
            {"5b", 9.55e9, 14.05e9, 26, 5940.0e6, 1.5, 60, 27}
        };
        return table;
    }

} //namespace detail

boost::optional<FrequencyBand> parse_frequency_band(std::string const& name)
{
    auto const& table = detail::band_table();
    for (std::size_t ii = 0; ii < table.size(); ++ii)
    {
        if (table[ii].name == name)
        {
            return static_cast<FrequencyBand>(ii);
        }
    }
    return boost::none;
}

std::string to_string(FrequencyBand band)
{
    return band_parameters(band).name;
}

bool is_band_5(FrequencyBand band)
{
    return band == FrequencyBand::BAND_5A || band == FrequencyBand::BAND_5B;
}

BandParameters const& band_parameters(FrequencyBand band)
{
    return detail::band_table().at(static_cast<std::size_t>(band));
}

double dish_sample_rate(FrequencyBand band, int k)
{
    auto const& params = band_parameters(band);
    return params.base_dish_sample_rate + params.sample_rate_const * k * constants::delta_f;
}

double fs_sample_rate(FrequencyBand band, int k)
{
    return dish_sample_rate(band, k) * constants::vcc_oversampling_factor
        / band_parameters(band).total_num_fs;
}

double frequency_slice_start(FrequencyBand band,
    int frequency_slice_id,
    std::pair<double, double> const& band_5_tuning,
    double offset_stream1,
    double offset_stream2)
{
    if (!is_band_5(band))
    {
        return band_parameters(band).start + offset_stream1
            + (frequency_slice_id - 1) * constants::frequency_slice_bw;
    }
    int const slices_per_stream = band_parameters(band).num_frequency_slices / 2;
    if (frequency_slice_id <= slices_per_stream)
    {
        return band_5_tuning.first * 1e9 + offset_stream1
            - constants::band_5_stream_bw / 2.0
            + (frequency_slice_id - 1) * constants::frequency_slice_bw;
    }
    return band_5_tuning.second * 1e9 + offset_stream2
        - constants::band_5_stream_bw / 2.0
        + (frequency_slice_id - slices_per_stream - 1) * constants::frequency_slice_bw;
}

} //namespace subarray
} //namespace cbfmcs_cpp
