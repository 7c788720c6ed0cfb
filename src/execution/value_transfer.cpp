#include <benefactor/execution/value_transfer.hpp>

#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>

namespace benefactor::execution {

bool request_transfer(const value_transfer_t& transfer,
                      const transfer_request& request) {
  if (!transfer) {
    spdlog::warn("No value transfer primitive installed");
    return false;
  }
  try {
    return transfer(request);
  } catch (const std::exception& ex) {
    spdlog::error("Value transfer of {} from {} to {} raised: {}",
                  benefactor::schema::to_string(request.amount),
                  benefactor::schema::to_hex(request.from),
                  benefactor::schema::to_hex(request.to), ex.what());
    return false;
  }
}

benefactor::schema::timestamp_milliseconds_t system_clock_milliseconds() {
  return static_cast<benefactor::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace benefactor::execution
