#ifndef FRAMESINK_HPP_
#define FRAMESINK_HPP_

#include "IntTypes.hpp"

#include <vector>

namespace Shrimpy {

// Receives the packed GPU buffer once per frame, e.g. to upload it into a
// storage buffer. Implementations take over the blob
class FrameSink
{
public:
    virtual ~FrameSink() {}

    virtual void submit(std::vector<uint8> blob) = 0;
};

}

#endif /* FRAMESINK_HPP_ */
