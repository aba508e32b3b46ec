#ifndef CBFMCS_CPP_COMMON_HPP
#define CBFMCS_CPP_COMMON_HPP

#define BOOST_LOG_DYN_LINK 1
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>

#include <cstddef>
#include <stdexcept>
#include <memory>
#include <string>
#include <vector>
#include <iostream>
#include <sstream>
#include <iomanip>

#endif //CBFMCS_CPP_COMMON_HPP
