#ifndef SCENELOADER_HPP_
#define SCENELOADER_HPP_

#include "JsonPtr.hpp"

#include "IntTypes.hpp"

#include <unordered_map>
#include <string>

namespace Shrimpy {

class FrameState;
class Camera;
class Scene;

// Populates a scene, camera and frame description from a JSON scene file.
// Mesh paths are resolved relative to the directory of the scene file
class SceneLoader
{
    std::string _baseDir;
    Scene &_scene;
    std::unordered_map<std::string, uint32> _materialIds;

    void loadMaterial(JsonPtr value);
    void loadPrimitive(JsonPtr value);
    uint32 fetchMaterial(JsonPtr value) const;

    SceneLoader(const std::string &baseDir, Scene &scene);

public:
    static void load(JsonPtr document, const std::string &baseDir, Scene &scene, Camera &camera, FrameState &frame);
    static void loadFile(const std::string &path, Scene &scene, Camera &camera, FrameState &frame);
};

}

#endif /* SCENELOADER_HPP_ */
