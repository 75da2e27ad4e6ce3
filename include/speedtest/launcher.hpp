#pragma once
#include <functional>
#include <thread>
#include <utility>

/**
* @file
* @brief How the server and client start their per-task threads.
*
* Both the responder set and the transfer pool start threads through a
* @ref speedtest::ThreadLauncher, so the failure of @c std::thread creation
* (@c std::system_error, e.g. @c EAGAIN when the process is out of threads)
* can be handled per task and exercised in tests.
*/

namespace speedtest {

/// @brief Starts @p body on a new thread. May throw @c std::system_error.
using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

inline std::thread launch_thread(std::function<void()> body) {
    return std::thread(std::move(body));
}

} // namespace speedtest
