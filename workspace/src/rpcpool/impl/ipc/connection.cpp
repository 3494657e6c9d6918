/**
 * @file connection.cpp
 * @brief Connection identity allocation
 */

#include "ipc/connection.h"
#include <atomic>

namespace rpcpool {
namespace ipc {

uint64_t nextConnectionId() {
    static std::atomic<uint64_t> next_id{1};
    return next_id.fetch_add(1);
}

} // namespace ipc
} // namespace rpcpool
