#ifndef SHARED_HPP_
#define SHARED_HPP_

#include "renderer/ViewerSession.hpp"
#include "renderer/FrameSink.hpp"

#include "scene/CapacityException.hpp"

#include "gpu/GpuLayout.hpp"
#include "gpu/GpuPacker.hpp"

#include "io/JsonLoadException.hpp"
#include "io/SceneLoader.hpp"
#include "io/FileUtils.hpp"
#include "io/CliParser.hpp"

#include "math/Angle.hpp"

#include "Logging.hpp"
#include "Timer.hpp"
#include "Debug.hpp"

#include <tinyformat/tinyformat.hpp>
#include <iostream>
#include <memory>
#include <vector>

namespace Shrimpy {

static const int OPT_VERSION  = 0;
static const int OPT_HELP     = 1;
static const int OPT_OUTPUT   = 2;
static const int OPT_DUMP_BVH = 3;
static const int OPT_FRAMES   = 4;
static const int OPT_INSPECT  = 5;
static const int OPT_QUIET    = 6;

// Stores the most recent frame and writes it out on request
class FileFrameSink : public FrameSink
{
    std::vector<uint8> _blob;
    uint32 _submitted;

public:
    FileFrameSink()
    : _submitted(0)
    {
    }

    virtual void submit(std::vector<uint8> blob) override
    {
        _blob = std::move(blob);
        _submitted++;
    }

    bool write(const std::string &path) const
    {
        return FileUtils::writeBinary(path, _blob);
    }

    uint32 submitted() const
    {
        return _submitted;
    }
};

class BlobExporter
{
    CliParser &_parser;
    std::ostream &_logStream;

    uint32 _frames;
    std::string _outputFile;
    std::unique_ptr<ViewerSession> _session;

    void dumpBvh(const Scene &scene) const
    {
        const auto &nodes = scene.bvhNodes();
        _logStream << tfm::format("BVH with %d nodes over %d triangles", nodes.size(),
                scene.triangles().size()) << std::endl;
        for (size_t i = 0; i < nodes.size(); ++i) {
            const Bvh::BvhNode &node = nodes[i];
            if (node.isLeaf()) {
                std::string ids;
                for (uint32 t = 0; t < node.triangleCount; ++t)
                    ids += tfm::format(t ? " %d" : "%d", node.triangleIds[t]);
                _logStream << tfm::format("  %3d leaf     %s tris [%s]", i, node.bbox(), ids) << std::endl;
            } else {
                _logStream << tfm::format("  %3d interior %s children %d %d", i, node.bbox(),
                        node.child1, node.child2) << std::endl;
            }
        }
    }

    int inspect(const std::string &path) const
    {
        std::string text = FileUtils::loadText(path);
        std::vector<uint8> blob(text.begin(), text.end());
        if (blob.size() != GpuLayout::BlobLayout::Size) {
            std::cerr << tfm::format("'%s' is not a packed frame: expected %d bytes, found %d",
                    path, GpuLayout::BlobLayout::Size, blob.size()) << std::endl;
            return 1;
        }

        GpuReader reader(blob);
        Camera camera = GpuPacker::readCamera(reader.at(GpuLayout::BlobLayout::Camera));
        GpuReader frame = reader.at(GpuLayout::BlobLayout::Frame);
        GpuPacker::SceneCounts counts = GpuPacker::readSceneCounts(reader.at(GpuLayout::BlobLayout::Scene));

        _logStream << tfm::format("Camera: position %s direction %s fov %.1f deg, %d bounces",
                camera.pos(), camera.dir(), Angle::radToDeg(camera.fov()), camera.maxRayBounces()) << std::endl;
        _logStream << tfm::format("Frame: %dx%d, frame %d at %.3fs, gamma %.2f",
                frame.readU32(GpuLayout::FrameLayout::Width), frame.readU32(GpuLayout::FrameLayout::Height),
                frame.readU32(GpuLayout::FrameLayout::FrameCount),
                frame.readF32(GpuLayout::FrameLayout::ElapsedSeconds),
                frame.readF32(GpuLayout::FrameLayout::GammaCorrection)) << std::endl;
        _logStream << tfm::format("Scene: %d materials, %d spheres, %d triangles, %d BVH nodes",
                counts.materialCount, counts.sphereCount, counts.triangleCount, counts.bvhNodeCount) << std::endl;
        return 0;
    }

public:
    BlobExporter(CliParser &parser, std::ostream &logStream)
    : _parser(parser),
      _logStream(logStream),
      _frames(1)
    {
        parser.addOption('h', "help", "Prints this help text", false, OPT_HELP);
        parser.addOption('v', "version", "Prints version information", false, OPT_VERSION);
        parser.addOption('o', "output", "Writes the packed GPU buffer of the last frame to this file", true, OPT_OUTPUT);
        parser.addOption('b', "dump-bvh", "Prints the flattened BVH node array", false, OPT_DUMP_BVH);
        parser.addOption('f', "frames", "Number of frames to advance before writing the buffer (default: 1)", true, OPT_FRAMES);
        parser.addOption('i', "inspect", "Prints a summary of a previously written buffer instead of loading a scene", true, OPT_INSPECT);
        parser.addOption('q', "quiet", "Suppresses debug output", false, OPT_QUIET);
    }

    // Returns the process exit code
    int run()
    {
        if (_parser.isPresent(OPT_QUIET))
            DebugUtils::setQuiet(true);

        if (_parser.isPresent(OPT_INSPECT))
            return inspect(_parser.param(OPT_INSPECT));

        if (_parser.operands().size() != 1 || _parser.isPresent(OPT_HELP)) {
            _parser.printHelpText(std::cout);
            return _parser.isPresent(OPT_HELP) ? 0 : 1;
        }

        if (_parser.isPresent(OPT_FRAMES))
            _frames = _parser.intParam(OPT_FRAMES);
        if (_parser.isPresent(OPT_OUTPUT))
            _outputFile = _parser.param(OPT_OUTPUT);

        const std::string &scenePath = _parser.operands().front();
        printTimestampedLog(tfm::format("Loading scene '%s'...", scenePath));

        Timer timer;
        try {
            Scene scene;
            Camera camera;
            FrameState frame;
            SceneLoader::loadFile(scenePath, scene, camera, frame);
            scene.build();
            _session.reset(new ViewerSession(scene, camera, frame));
        } catch (const JsonLoadException &e) {
            std::cerr << e.what() << std::endl;
            return 1;
        } catch (const CapacityException &e) {
            std::cerr << tfm::format("Scene '%s' does not fit the GPU buffer: %s", scenePath, e.what()) << std::endl;
            return 1;
        } catch (const std::runtime_error &e) {
            std::cerr << tfm::format("Unable to load scene '%s': %s", scenePath, e.what()) << std::endl;
            return 1;
        }
        timer.stop();

        const Scene &scene = _session->scene();
        printTimestampedLog(tfm::format("Loaded %d materials, %d spheres and %d triangles (%d BVH nodes) in %.1fms",
                scene.materials().size(), scene.spheres().size(), scene.triangles().size(),
                scene.bvhNodes().size(), timer.elapsed()*1000.0));

        if (_parser.isPresent(OPT_DUMP_BVH))
            dumpBvh(scene);

        FileFrameSink sink;
        for (uint32 i = 0; i < _frames; ++i)
            _session->renderFrame(sink);

        if (!_outputFile.empty()) {
            if (sink.submitted() == 0) {
                std::cerr << "No frames were produced, nothing to write" << std::endl;
                return 1;
            }
            if (!sink.write(_outputFile)) {
                std::cerr << tfm::format("Unable to write output file '%s'", _outputFile) << std::endl;
                return 1;
            }
            printTimestampedLog(tfm::format("Wrote frame %d (%d bytes) to '%s'",
                    _session->frame().frameCount(), GpuLayout::BlobLayout::Size, _outputFile));
        }

        return 0;
    }
};

}

#endif /* SHARED_HPP_ */
