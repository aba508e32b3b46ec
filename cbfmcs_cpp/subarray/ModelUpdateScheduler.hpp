#ifndef CBFMCS_CPP_SUBARRAY_MODELUPDATESCHEDULER_HPP
#define CBFMCS_CPP_SUBARRAY_MODELUPDATESCHEDULER_HPP

#include "cbfmcs_cpp/subarray/ObsState.hpp"
#include "cbfmcs_cpp/common.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace cbfmcs_cpp {
namespace subarray {

enum class ModelType
{
    DELAY_MODEL = 0,
    JONES_MATRIX,
    BEAM_WEIGHTS
};

std::string to_string(ModelType type);

/**
 * @brief      One time-stamped entry of a model document.
 */
struct ModelEntry
{
    ModelType type;
    double epoch; // UNIX seconds
    std::string destination_type; // "vcc", "fsp" or empty for both
    std::string payload; // JSON of the entry
};

/**
 * @brief      Receiver of due model entries.
 */
class ModelUpdateSink
{
public:
    virtual ~ModelUpdateSink() {}

    virtual ObsState obs_state() const = 0;

    /**
     * @brief      Fan a due entry out to the fleet.
     *
     * @detail     Called from a dispatcher thread. Implementations
     *             re-check the observation state before sending.
     */
    virtual void apply_model_update(ModelEntry const& entry) = 0;
};

/**
 * @brief      Applies model entries to the fleet at their epochs.
 *
 * @detail     Each model type has its own dispatcher thread and its own
 *             pending queue ordered by epoch, so entries of one type are
 *             applied in ascending epoch order and never concurrently.
 *             An entry with the same epoch and destination type as a
 *             pending entry of the same type supersedes it. Epochs at or
 *             before now are applied immediately.
 *
 *             Documents are only accepted while the sink reports READY
 *             or SCANNING. A document byte-identical to the last accepted
 *             document of its type is dropped.
 */
class ModelUpdateScheduler
{
public:
    typedef std::chrono::system_clock Clock;

public:
    explicit ModelUpdateScheduler(ModelUpdateSink& sink);
    ~ModelUpdateScheduler();
    ModelUpdateScheduler(ModelUpdateScheduler const&) = delete;

    void start();
    void stop();

    /**
     * @brief      Accept a raw model document for scheduling.
     *
     * @return     true if the document was accepted.
     */
    bool on_model_document(ModelType type, std::string const& document);

    /**
     * @brief      Forget the last accepted document of every type.
     *
     * @detail     Pending entries are kept.
     */
    void reset_history();

    std::size_t pending(ModelType type) const;

    /**
     * @brief      Number of entries of the type taken off the queue,
     *             whether sent to the sink or dropped.
     */
    std::size_t dispatched(ModelType type) const;

    /**
     * @brief      Block until no entries of the type are pending or
     *             being applied, or until the timeout expires.
     *
     * @return     true if the dispatcher went idle.
     */
    bool wait_until_idle(ModelType type, std::chrono::milliseconds timeout) const;

    /**
     * @brief      Parse a model document into its entries.
     *
     * @note       Throws std::runtime_error on a malformed document,
     *             including epochs that are not finite or that lie beyond
     *             the range of the scheduler clock.
     */
    static std::vector<ModelEntry> parse(ModelType type, std::string const& document);

private:
    struct Dispatcher
    {
        Dispatcher();

        ModelType type;
        mutable std::mutex mutex;
        mutable std::condition_variable wakeup;
        mutable std::condition_variable idle;
        // Keyed by epoch and destination type
        std::map<std::pair<double, std::string>, ModelEntry> pending;
        std::string last_document;
        std::size_t dispatched;
        bool busy;
        bool stop;
        std::thread thread;
    };

    Dispatcher& dispatcher(ModelType type);
    Dispatcher const& dispatcher(ModelType type) const;
    void run(Dispatcher& dispatcher);

private:
    ModelUpdateSink& _sink;
    Dispatcher _dispatchers[3];
    bool _running;
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_MODELUPDATESCHEDULER_HPP
