#include "cbfmcs_cpp/subarray/ModelUpdateScheduler.hpp"
#include "cbfmcs_cpp/subarray/ScanConfiguration.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace cbfmcs_cpp {
namespace subarray {
namespace detail {

    struct ModelKeys
    {
        char const* list;
        char const* details;
    };

    ModelKeys model_keys(ModelType type)
    {
        switch (type)
        {
            case ModelType::DELAY_MODEL: return ModelKeys{"delayModel", "delayDetails"};
            case ModelType::JONES_MATRIX: return ModelKeys{"jonesMatrix", "matrixDetails"};
            case ModelType::BEAM_WEIGHTS: return ModelKeys{"beamWeights", "beamWeightsDetails"};
        }
        throw std::runtime_error("Unknown model type");
    }

    double max_epoch()
    {
        return std::chrono::duration_cast<std::chrono::duration<double>>(
            ModelUpdateScheduler::Clock::duration::max()).count();
    }

    ModelUpdateScheduler::Clock::time_point to_time_point(double epoch)
    {
        auto since_epoch = std::chrono::duration_cast<ModelUpdateScheduler::Clock::duration>(
            std::chrono::duration<double>(epoch));
        return ModelUpdateScheduler::Clock::time_point(since_epoch);
    }

} //namespace detail

std::string to_string(ModelType type)
{
    switch (type)
    {
        case ModelType::DELAY_MODEL: return "delay model";
        case ModelType::JONES_MATRIX: return "Jones matrix";
        case ModelType::BEAM_WEIGHTS: return "beam weights";
    }
    return "unknown model";
}

ModelUpdateScheduler::Dispatcher::Dispatcher()
    : type(ModelType::DELAY_MODEL)
    , dispatched(0)
    , busy(false)
    , stop(false)
{
}

ModelUpdateScheduler::ModelUpdateScheduler(ModelUpdateSink& sink)
    : _sink(sink)
    , _running(false)
{
    _dispatchers[0].type = ModelType::DELAY_MODEL;
    _dispatchers[1].type = ModelType::JONES_MATRIX;
    _dispatchers[2].type = ModelType::BEAM_WEIGHTS;
}

ModelUpdateScheduler::~ModelUpdateScheduler()
{
    stop();
}

ModelUpdateScheduler::Dispatcher& ModelUpdateScheduler::dispatcher(ModelType type)
{
    return _dispatchers[static_cast<std::size_t>(type)];
}

ModelUpdateScheduler::Dispatcher const& ModelUpdateScheduler::dispatcher(ModelType type) const
{
    return _dispatchers[static_cast<std::size_t>(type)];
}

void ModelUpdateScheduler::start()
{
    if (_running)
    {
        return;
    }
    BOOST_LOG_TRIVIAL(debug) << "Starting model update dispatchers";
    for (auto& d: _dispatchers)
    {
        {
            std::lock_guard<std::mutex> lock(d.mutex);
            d.stop = false;
        }
        d.thread = std::thread(&ModelUpdateScheduler::run, this, std::ref(d));
    }
    _running = true;
}

void ModelUpdateScheduler::stop()
{
    if (!_running)
    {
        return;
    }
    BOOST_LOG_TRIVIAL(debug) << "Stopping model update dispatchers";
    for (auto& d: _dispatchers)
    {
        {
            std::lock_guard<std::mutex> lock(d.mutex);
            d.stop = true;
        }
        d.wakeup.notify_all();
    }
    for (auto& d: _dispatchers)
    {
        if (d.thread.joinable())
        {
            d.thread.join();
        }
    }
    _running = false;
}

std::vector<ModelEntry> ModelUpdateScheduler::parse(ModelType type, std::string const& document)
{
    auto keys = detail::model_keys(type);
    std::vector<ModelEntry> entries;
    try
    {
        auto tree = json::parse(document);
        for (auto const& item: tree.get_child(keys.list))
        {
            ModelEntry entry;
            entry.type = type;
            entry.epoch = item.second.get<double>("epoch");
            if (!std::isfinite(entry.epoch) || std::fabs(entry.epoch) >= detail::max_epoch())
            {
                std::stringstream msg;
                msg << "epoch " << std::setprecision(17) << entry.epoch << " is out of range";
                throw std::runtime_error(msg.str());
            }
            entry.destination_type = item.second.get<std::string>("destinationType", "");
            if (!entry.destination_type.empty()
                && entry.destination_type != "vcc" && entry.destination_type != "fsp")
            {
                throw std::runtime_error(std::string("unknown destinationType '")
                    + entry.destination_type + "'");
            }
            item.second.get_child(keys.details);
            entry.payload = json::serialize(item.second);
            entries.push_back(entry);
        }
    }
    catch (boost::property_tree::ptree_error& e)
    {
        throw std::runtime_error(std::string("Malformed ") + to_string(type) + " document: " + e.what());
    }
    catch (std::runtime_error& e)
    {
        throw std::runtime_error(std::string("Malformed ") + to_string(type) + " document: " + e.what());
    }
    return entries;
}

bool ModelUpdateScheduler::on_model_document(ModelType type, std::string const& document)
{
    ObsState state = _sink.obs_state();
    if (state != ObsState::READY && state != ObsState::SCANNING)
    {
        BOOST_LOG_TRIVIAL(warning) << "Ignoring " << to_string(type)
                                   << " update received in obsState " << state;
        return false;
    }

    auto& d = dispatcher(type);
    {
        std::lock_guard<std::mutex> lock(d.mutex);
        if (document == d.last_document)
        {
            BOOST_LOG_TRIVIAL(warning) << "Received identical " << to_string(type)
                                       << ", dropping update";
            return false;
        }
    }

    std::vector<ModelEntry> entries;
    try
    {
        entries = parse(type, document);
    }
    catch (std::runtime_error& e)
    {
        BOOST_LOG_TRIVIAL(error) << e.what();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(d.mutex);
        d.last_document = document;
        for (auto const& entry: entries)
        {
            auto key = std::make_pair(entry.epoch, entry.destination_type);
            auto it = d.pending.find(key);
            if (it != d.pending.end())
            {
                BOOST_LOG_TRIVIAL(debug) << "Superseding pending " << to_string(type)
                                         << " for epoch " << entry.epoch;
                it->second = entry;
            }
            else
            {
                d.pending.insert(std::make_pair(key, entry));
            }
        }
    }
    BOOST_LOG_TRIVIAL(info) << "Scheduled " << entries.size() << " " << to_string(type) << " entries";
    d.wakeup.notify_all();
    return true;
}

void ModelUpdateScheduler::reset_history()
{
    for (auto& d: _dispatchers)
    {
        std::lock_guard<std::mutex> lock(d.mutex);
        d.last_document.clear();
    }
}

std::size_t ModelUpdateScheduler::pending(ModelType type) const
{
    auto const& d = dispatcher(type);
    std::lock_guard<std::mutex> lock(d.mutex);
    return d.pending.size();
}

std::size_t ModelUpdateScheduler::dispatched(ModelType type) const
{
    auto const& d = dispatcher(type);
    std::lock_guard<std::mutex> lock(d.mutex);
    return d.dispatched;
}

bool ModelUpdateScheduler::wait_until_idle(ModelType type, std::chrono::milliseconds timeout) const
{
    auto const& d = dispatcher(type);
    std::unique_lock<std::mutex> lock(d.mutex);
    return d.idle.wait_for(lock, timeout, [&d]{ return d.pending.empty() && !d.busy; });
}

void ModelUpdateScheduler::run(Dispatcher& d)
{
    BOOST_LOG_TRIVIAL(debug) << "Dispatcher for " << to_string(d.type) << " running";
    std::unique_lock<std::mutex> lock(d.mutex);
    while (!d.stop)
    {
        if (d.pending.empty())
        {
            d.idle.notify_all();
            d.wakeup.wait(lock);
            continue;
        }
        auto it = d.pending.begin();
        auto due = detail::to_time_point(it->first.first);
        if (due > Clock::now())
        {
            d.wakeup.wait_until(lock, due);
            continue;
        }
        ModelEntry entry = it->second;
        d.pending.erase(it);
        d.busy = true;
        lock.unlock();

        BOOST_LOG_TRIVIAL(debug) << "Applying " << to_string(entry.type) << " for epoch " << entry.epoch;
        try
        {
            ObsState state = _sink.obs_state();
            if (state == ObsState::READY || state == ObsState::SCANNING)
            {
                _sink.apply_model_update(entry);
            }
            else
            {
                BOOST_LOG_TRIVIAL(warning) << "Dropping " << to_string(entry.type) << " for epoch "
                                           << entry.epoch << " in obsState " << state;
            }
        }
        catch (std::exception& e)
        {
            BOOST_LOG_TRIVIAL(error) << "Failed to apply " << to_string(entry.type) << ": " << e.what();
        }

        lock.lock();
        ++d.dispatched;
        d.busy = false;
    }
    d.idle.notify_all();
    BOOST_LOG_TRIVIAL(debug) << "Dispatcher for " << to_string(d.type) << " stopped";
}

} //namespace subarray
} //namespace cbfmcs_cpp
