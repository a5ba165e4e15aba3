#ifndef CHUNKNODE_COORDINATOR_ERROR_HPP
#define CHUNKNODE_COORDINATOR_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunknode::coordinator {

class CoordinatorError : public std::runtime_error {
public:
    explicit CoordinatorError(const std::string& message)
        : std::runtime_error(message) {}
};

// Network failure, timeout or unresolvable host
class CoordinatorUnreachable : public CoordinatorError {
public:
    explicit CoordinatorUnreachable(const std::string& message)
        : CoordinatorError("Coordinator unreachable: " + message) {}
};

// The coordinator answered but refused the request
class CoordinatorRejected : public CoordinatorError {
public:
    explicit CoordinatorRejected(const std::string& message)
        : CoordinatorError("Coordinator rejected request: " + message) {}
};

} // namespace chunknode::coordinator

#endif // CHUNKNODE_COORDINATOR_ERROR_HPP
