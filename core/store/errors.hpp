#pragma once

#include <stdexcept>
#include <string>

namespace itemstore {
namespace store {

/**
 * @brief The store connection was used outside its init()/close() window
 *
 * Lifecycle bug, never a client error. Nothing in the request path
 * catches it; it reaches the HTTP exception handler and becomes a 500.
 */
class UninitializedError : public std::logic_error {
public:
    explicit UninitializedError(const std::string &what) : std::logic_error(what) {}
};

}  // namespace store
}  // namespace itemstore
