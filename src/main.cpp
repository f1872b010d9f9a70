#include "edc_errors.hpp"
#include "edc_parser.hpp"
#include "fmt_wrapper.hpp"
#include "log.hpp"
#include "svd_generator.hpp"

#include <exception>
#include <fstream>
#include <pugixml.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

void printUsage(std::string_view program) {
    fmt::print("\nUsage: {} [options] <input.edc> <output.svd>\n\n"
               "Options:\n"
               "    -h, --help          show this help message\n"
               "    -v, --verbose       activate verbose output\n",
               program);
}

edc2svd::Device loadDevice(std::string const& edcfile) {
    pugi::xml_document doc;
    auto const         result = doc.load_file(edcfile.c_str());
    if(!result) {
        edc2svd::fail(edc2svd::ErrorKind::MissingStructure,
                      "cannot read {}: {}",
                      edcfile,
                      result.description());
    }
    return edc2svd::DeviceFromEDC(doc.document_element());
}

void writeSvd(edc2svd::Device const& device,
              std::string const&     svdfile) {
    std::ofstream out{svdfile};
    if(!out) {
        throw std::runtime_error(fmt::format("cannot open file {}", svdfile));
    }
    Generator::Svd::write(device, out);
    if(!out) {
        throw std::runtime_error(fmt::format("cannot write file {}", svdfile));
    }
}
}   // namespace

int main(int                argc,
         char const* const* argv) {
    static constexpr std::string_view program = "edc2svd";
    try {
        bool                     help    = false;
        bool                     verbose = false;
        std::vector<std::string> positional;
        for(int i = 1; i < argc; ++i) {
            std::string_view const arg{argv[i]};
            if(arg == "-h" || arg == "--help") {
                help = true;
            } else if(arg == "-v" || arg == "--verbose") {
                verbose = true;
            } else if(arg.starts_with("-") && arg.size() > 1) {
                printUsage(program);
                return 0;
            } else {
                positional.emplace_back(arg);
            }
        }

        edc2svd::Log::setVerbose(verbose);

        if(help || positional.size() != 2) {
            printUsage(program);
            return 0;
        }
        std::string const& edcfile = positional[0];
        std::string const& svdfile = positional[1];

        auto const device = loadDevice(edcfile);
        writeSvd(device, svdfile);

        return 0;
    } catch(std::exception const& exception) {
        fmt::print(stderr, "caught {}\n", exception.what());
        return 1;
    }
}
