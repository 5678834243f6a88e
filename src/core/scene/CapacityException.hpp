#ifndef CAPACITYEXCEPTION_HPP_
#define CAPACITYEXCEPTION_HPP_

#include <stdexcept>
#include <string>

namespace Shrimpy {

// Thrown when an append would exceed one of the fixed GPU-side array sizes.
// The container that raised it is left unchanged
class CapacityException : public std::runtime_error
{
    std::string _container;
    size_t _capacity;
    size_t _requested;

public:
    CapacityException(const std::string &container, size_t capacity, size_t requested);

    const std::string &container() const { return _container; }
    size_t capacity() const { return _capacity; }
    size_t requested() const { return _requested; }
};

}

#endif /* CAPACITYEXCEPTION_HPP_ */
