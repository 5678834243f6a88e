#include "SceneLoader.hpp"

#include "JsonDocument.hpp"
#include "ObjLoader.hpp"
#include "FileUtils.hpp"

#include "renderer/FrameState.hpp"

#include "cameras/Camera.hpp"

#include "scene/Scene.hpp"

#include "Logging.hpp"
#include "Debug.hpp"

#include <vector>

namespace Shrimpy {

SceneLoader::SceneLoader(const std::string &baseDir, Scene &scene)
: _baseDir(baseDir),
  _scene(scene)
{
}

void SceneLoader::loadMaterial(JsonPtr value)
{
    if (!value.isObject())
        value.parseError("Type mismatch: Expecting a material object here");

    MaterialTypeEnum type(MaterialType::Diffuse);
    if (auto t = value["type"])
        type = MaterialTypeEnum(t);

    Vec3f color(1.0f);
    float emission = 0.0f, density = 1.0f;
    value.getField("color", color);
    value.getField("emission", emission);
    value.getField("density", density);

    Material material;
    if (type == MaterialType::Dielectric) {
        float ior = 1.5f;
        value.getField("ior", ior);
        if (ior <= 0.0f)
            value.parseError(tfm::format("Index of refraction must be positive, received %f", ior));
        material = Material::dielectric(color, ior, emission, density);
    } else {
        float roughness = 1.0f;
        value.getField("roughness", roughness);
        if (roughness < 0.0f || roughness > 1.0f)
            value.parseError(tfm::format("Roughness must be between 0 and 1, received %f", roughness));
        material = Material::diffuse(color, roughness, emission, density);
    }

    uint32 id = _scene.addMaterial(material);

    std::string name;
    if (value.getField("name", name)) {
        if (_materialIds.count(name))
            value.parseError(tfm::format("Duplicate material name \"%s\"", name));
        _materialIds.insert(std::make_pair(name, id));
    }
}

uint32 SceneLoader::fetchMaterial(JsonPtr value) const
{
    if (!value)
        return 0;

    uint32 id;
    if (value.isString()) {
        auto iter = _materialIds.find(value.cast<std::string>());
        if (iter == _materialIds.end())
            value.parseError(tfm::format("Unknown material \"%s\"", value.cast<std::string>()));
        id = iter->second;
    } else {
        id = value.cast<uint32>();
    }

    if (id >= _scene.materials().size())
        value.parseError(tfm::format("Material index %d out of range (%d materials defined)",
                id, _scene.materials().size()));
    return id;
}

void SceneLoader::loadPrimitive(JsonPtr value)
{
    std::string type = value.castField<std::string>("type");
    uint32 materialId = fetchMaterial(value["material"]);

    if (type == "sphere") {
        Sphere sphere(Vec3f(0.0f), 1.0f, materialId);
        value.getField("center", sphere.center);
        value.getField("radius", sphere.radius);
        if (sphere.radius <= 0.0f)
            value.parseError(tfm::format("Sphere radius must be positive, received %f", sphere.radius));
        _scene.addSphere(sphere);
    } else if (type == "triangle") {
        JsonPtr vertices = value.getRequiredMember("vertices");
        if (vertices.size() != 3)
            vertices.parseError("A triangle needs exactly three vertices");
        _scene.addTriangle(Triangle(vertices[0u].cast<Vec3f>(), vertices[1u].cast<Vec3f>(),
                vertices[2u].cast<Vec3f>(), materialId));
    } else if (type == "mesh") {
        JsonPtr file = value.getRequiredMember("file");
        std::string path = FileUtils::resolve(_baseDir, file.cast<std::string>());

        std::vector<Triangle> tris;
        if (!ObjLoader::loadTriangles(path, materialId, tris))
            file.parseError(tfm::format("Unable to load mesh at '%s'", path));
        if (tris.empty())
            printWarning(tfm::format("Mesh '%s' does not contain any triangles", path));
        _scene.addTriangles(tris);
    } else {
        value.parseError(tfm::format("Unknown primitive type: \"%s\". Available options are: "
                "sphere, triangle, mesh", type));
    }
}

void SceneLoader::load(JsonPtr document, const std::string &baseDir, Scene &scene, Camera &camera,
        FrameState &frame)
{
    if (!document.isObject())
        document.parseError("Scene file must contain a JSON object");

    if (auto c = document["camera"])
        camera.fromJson(c);
    if (auto f = document["frame"])
        frame.fromJson(f);

    SceneLoader loader(baseDir, scene);
    JsonPtr materials = document["materials"];
    if (materials && !materials.isArray())
        materials.parseError("Type mismatch: Expecting an array of materials here");
    for (unsigned i = 0; i < materials.size(); ++i)
        loader.loadMaterial(materials[i]);
    // Geometry without materials still needs something to point at
    if (scene.materials().empty())
        scene.addMaterial(Material());

    JsonPtr primitives = document["primitives"];
    if (primitives && !primitives.isArray())
        primitives.parseError("Type mismatch: Expecting an array of primitives here");
    for (unsigned i = 0; i < primitives.size(); ++i)
        loader.loadPrimitive(primitives[i]);

    scene.validate();
}

void SceneLoader::loadFile(const std::string &path, Scene &scene, Camera &camera, FrameState &frame)
{
    JsonDocument document(path);
    load(document, FileUtils::parentPath(path), scene, camera, frame);
}

}
