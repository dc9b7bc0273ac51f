#pragma once

#include <changefeed/config.hpp>

#include <boost/outcome/config.hpp>
#include <boost/outcome/experimental/status_result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

CHANGEFEED_NAMESPACE_BEGIN

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

template <class T>
using Result = outcome::experimental::status_result<T>;

using outcome::success;

CHANGEFEED_NAMESPACE_END
