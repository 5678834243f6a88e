#include "Version.hpp"
#include "Shared.hpp"

using namespace Shrimpy;

int main(int argc, const char *argv[])
{
    CliParser parser("shrimpy", "[options] scene.json");

    BlobExporter exporter(parser, std::cout);

    try {
        parser.parse(argc, argv);
        if (parser.isPresent(OPT_VERSION)) {
            std::cout << "shrimpy, version " << VERSION_STRING << std::endl;
            return 0;
        }

        return exporter.run();
    } catch (const CliParseException &e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error &e) {
        std::cerr << "shrimpy: " << e.what() << std::endl;
        return 1;
    }
}
