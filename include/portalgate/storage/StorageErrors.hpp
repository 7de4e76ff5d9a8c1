#ifndef INCLUDE_PORTALGATE_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_PORTALGATE_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace portalgate::storage
{

// Raised when the backing database cannot complete an operation (open, busy past the
// configured timeout, disk error, constraint violation). Callers must fail closed.
class StoreIoError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace portalgate::storage

#endif // INCLUDE_PORTALGATE_STORAGE_STORAGEERRORS_HPP
