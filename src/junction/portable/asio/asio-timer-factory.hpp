#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <functional>

namespace junction::net {
/**
 * @brief Type erase the creation of steady-timer objects bound to `executor`
 */
inline std::function<boost::asio::steady_timer()>
make_steady_timer_factory(boost::asio::any_io_executor executor) {
  return [executor]() { return boost::asio::steady_timer{executor}; };
}

} // namespace junction::net
