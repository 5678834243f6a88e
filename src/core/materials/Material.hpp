#ifndef MATERIAL_HPP_
#define MATERIAL_HPP_

#include "math/Vec.hpp"

#include "StringableEnum.hpp"

#include <string>

namespace Shrimpy {

enum class MaterialType
{
    Diffuse,
    Dielectric,
};

typedef StringableEnum<MaterialType> MaterialTypeEnum;

class Material
{
    MaterialType _type;
    Vec3f _color;
    // Roughness in [0, 1] for diffuse materials, index of refraction for dielectrics
    float _parameter;
    float _emission;
    float _density;

    Material(MaterialType type, const Vec3f &color, float parameter, float emission, float density);

public:
    Material();

    static Material diffuse(const Vec3f &color, float roughness, float emission = 0.0f, float density = 1.0f);
    static Material dielectric(const Vec3f &color, float ior, float emission = 0.0f, float density = 1.0f);

    // The shader distinguishes the two material types by the sign of a single
    // float: non-negative values are a roughness, negative values an IOR
    float encodedRoughnessOrIor() const;
    static Material fromEncoded(const Vec3f &color, float roughnessOrIor, float emission, float density);

    MaterialType type() const
    {
        return _type;
    }

    bool isDielectric() const
    {
        return _type == MaterialType::Dielectric;
    }

    float roughness() const;
    float ior() const;

    const Vec3f &color() const
    {
        return _color;
    }

    float emission() const
    {
        return _emission;
    }

    float density() const
    {
        return _density;
    }

    void setColor(const Vec3f &color)
    {
        _color = color;
    }

    void setEmission(float emission)
    {
        _emission = emission;
    }

    void setDensity(float density)
    {
        _density = density;
    }

    bool operator==(const Material &o) const;
    bool operator!=(const Material &o) const
    {
        return !(*this == o);
    }
};

}

#endif /* MATERIAL_HPP_ */
