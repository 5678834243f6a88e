#include "Material.hpp"

#include "math/MathUtil.hpp"

#include "Debug.hpp"

#include <cmath>

namespace Shrimpy {

DEFINE_STRINGABLE_ENUM(MaterialTypeEnum, "material type", {
    {"diffuse", MaterialType::Diffuse},
    {"dielectric", MaterialType::Dielectric},
})

Material::Material(MaterialType type, const Vec3f &color, float parameter, float emission, float density)
: _type(type),
  _color(color),
  _parameter(parameter),
  _emission(emission),
  _density(density)
{
}

Material::Material()
: Material(MaterialType::Diffuse, Vec3f(1.0f), 1.0f, 0.0f, 1.0f)
{
}

Material Material::diffuse(const Vec3f &color, float roughness, float emission, float density)
{
    return Material(MaterialType::Diffuse, color, clamp(roughness, 0.0f, 1.0f), emission, density);
}

Material Material::dielectric(const Vec3f &color, float ior, float emission, float density)
{
    // An IOR of exactly zero would encode as a (diffuse) roughness of zero
    ASSERT(ior > 0.0f, "Dielectric IOR must be positive, received %f", ior);
    return Material(MaterialType::Dielectric, color, ior, emission, density);
}

float Material::encodedRoughnessOrIor() const
{
    return _type == MaterialType::Dielectric ? -_parameter : _parameter;
}

Material Material::fromEncoded(const Vec3f &color, float roughnessOrIor, float emission, float density)
{
    if (roughnessOrIor < 0.0f)
        return Material(MaterialType::Dielectric, color, -roughnessOrIor, emission, density);
    else
        return Material(MaterialType::Diffuse, color, roughnessOrIor, emission, density);
}

float Material::roughness() const
{
    return _type == MaterialType::Diffuse ? _parameter : 0.0f;
}

float Material::ior() const
{
    return _type == MaterialType::Dielectric ? _parameter : 1.0f;
}

bool Material::operator==(const Material &o) const
{
    return _type == o._type
        && _color == o._color
        && _parameter == o._parameter
        && _emission == o._emission
        && _density == o._density;
}

}
