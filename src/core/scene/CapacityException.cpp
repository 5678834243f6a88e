#include "CapacityException.hpp"

#include <tinyformat/tinyformat.hpp>

namespace Shrimpy {

CapacityException::CapacityException(const std::string &container, size_t capacity, size_t requested)
: std::runtime_error(tfm::format("Capacity of %s exceeded: requested %d entries, but only %d fit",
        container, requested, capacity)),
  _container(container),
  _capacity(capacity),
  _requested(requested)
{
}

}
