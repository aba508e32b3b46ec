#ifndef CBFMCS_CPP_SUBARRAY_ERRORS_HPP
#define CBFMCS_CPP_SUBARRAY_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace cbfmcs_cpp {
namespace subarray {

/**
 * @brief      A lifecycle command was issued in an observation
 *             state that does not permit it.
 */
class RejectedByState: public std::runtime_error
{
public:
    explicit RejectedByState(std::string const& what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @brief      A scan configuration failed validation. Carries the
 *             first offending reason only.
 */
class ValidationFailed: public std::runtime_error
{
public:
    explicit ValidationFailed(std::string const& what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @brief      A receptor is already owned by another subarray.
 */
class ResourceConflict: public std::runtime_error
{
public:
    explicit ResourceConflict(std::string const& what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @brief      A fleet node was unreachable or returned a failure.
 */
class RemoteCallFailed: public std::runtime_error
{
public:
    explicit RemoteCallFailed(std::string const& what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @brief      An internal invariant was violated. Routes the
 *             subarray to FAULT.
 */
class InternalInconsistency: public std::runtime_error
{
public:
    explicit InternalInconsistency(std::string const& what)
        : std::runtime_error(what)
    {
    }
};

} //namespace subarray
} //namespace cbfmcs_cpp

#endif //CBFMCS_CPP_SUBARRAY_ERRORS_HPP
