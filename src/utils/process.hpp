#pragma once

#include <boost/version.hpp>

// Boost 1.86 moved the classic Boost.Process API under process/v1 and made
// the unversioned headers v2.
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#else
#include <boost/process.hpp>
#endif

namespace rampart::utils {

#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

}  // namespace rampart::utils
