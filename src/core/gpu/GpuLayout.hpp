#ifndef GPULAYOUT_HPP_
#define GPULAYOUT_HPP_

#include "Platform.hpp"

#include <cstddef>

namespace Shrimpy {

// Byte layout of the storage buffer read by the tracing kernel. Every struct
// is a multiple of 16 bytes and every vec3 starts on a 16 byte boundary,
// padding is written as zeros
namespace GpuLayout {

namespace CameraLayout {
    CONSTEXPR size_t Position        = 0;
    CONSTEXPR size_t Direction       = 16;
    CONSTEXPR size_t Fov             = 28;
    CONSTEXPR size_t Width           = 32;
    CONSTEXPR size_t FocusDistance   = 36;
    CONSTEXPR size_t Aperture        = 40;
    CONSTEXPR size_t DivergeStrength = 44;
    CONSTEXPR size_t MaxRayBounces   = 48;
    CONSTEXPR size_t Size            = 64;
}

namespace FrameLayout {
    CONSTEXPR size_t Width           = 0;
    CONSTEXPR size_t Height          = 4;
    CONSTEXPR size_t ElapsedSeconds  = 8;
    CONSTEXPR size_t FrameCount      = 12;
    CONSTEXPR size_t GammaCorrection = 16;
    CONSTEXPR size_t Size            = 32;
}

namespace MaterialLayout {
    CONSTEXPR size_t Color          = 0;
    CONSTEXPR size_t RoughnessOrIor = 12;
    CONSTEXPR size_t Emission       = 16;
    CONSTEXPR size_t Density        = 20;
    CONSTEXPR size_t Size           = 32;
}

namespace SphereLayout {
    CONSTEXPR size_t Center     = 0;
    CONSTEXPR size_t Radius     = 12;
    CONSTEXPR size_t MaterialId = 16;
    CONSTEXPR size_t Size       = 32;
}

namespace TriangleLayout {
    CONSTEXPR size_t V0         = 0;
    CONSTEXPR size_t V1         = 16;
    CONSTEXPR size_t V2         = 32;
    CONSTEXPR size_t MaterialId = 48;
    CONSTEXPR size_t Size       = 64;
}

namespace BvhNodeLayout {
    CONSTEXPR size_t BboxMin       = 0;
    CONSTEXPR size_t BboxMax       = 16;
    CONSTEXPR size_t Child1        = 32;
    CONSTEXPR size_t Child2        = 36;
    CONSTEXPR size_t TriangleCount = 40;
    CONSTEXPR size_t TriangleIds   = 44;
    CONSTEXPR size_t Size          = 80;
}

namespace SceneLayout {
    CONSTEXPR size_t Materials     = 0;
    CONSTEXPR size_t Spheres       = 2048;
    CONSTEXPR size_t Triangles     = 4096;
    CONSTEXPR size_t BvhNodes      = 20480;
    CONSTEXPR size_t SphereCount   = 28160;
    CONSTEXPR size_t TriangleCount = 28164;
    CONSTEXPR size_t MaterialCount = 28168;
    CONSTEXPR size_t BvhNodeCount  = 28172;
    CONSTEXPR size_t Size          = 28176;
}

namespace BlobLayout {
    CONSTEXPR size_t Camera = 0;
    CONSTEXPR size_t Frame  = CameraLayout::Size;
    CONSTEXPR size_t Scene  = CameraLayout::Size + FrameLayout::Size;
    CONSTEXPR size_t Size   = Scene + SceneLayout::Size;
}

}

}

#endif /* GPULAYOUT_HPP_ */
