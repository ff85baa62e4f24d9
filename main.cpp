#include "cli_parser.hpp"
#include "codec_types.hpp"
#include "digest.hpp"
#include "file_image.hpp"
#include "metrics.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

static void printUsage()
{
    std::cout << "Usage:\n"
              << "  filepix encode --in <file> --out <image.png>\n"
              << "  filepix decode --in <image.png> --out <file>\n"
              << "  filepix info   --in <image.png>\n"
              << "  filepix verify --original <file> --image <image.png>\n";
}

static int exitCode(filepix::Status st)
{
    return st == filepix::Status::Ok ? 0 : 2;
}

static int runInfo(const std::string& imagePath)
{
    filepix::ImageInfo info;
    filepix::Status st = filepix::inspectImage(imagePath, info);
    if (info.width > 0) {
        std::cout << "[info] " << info.width << "x" << info.height
                  << " px, capacity " << info.capacityBytes << " bytes\n";
    }
    if (st != filepix::Status::Ok) {
        std::cerr << "[info] " << imagePath << ": " << filepix::statusName(st) << "\n";
        return exitCode(st);
    }

    metrics::PackingStats stats = metrics::computePackingStats(info.payloadBytes);
    std::cout << "[info] payload " << info.payloadBytes << " bytes, padding "
              << info.paddingBytes << " bytes, fill " << stats.fillRatio * 100.0 << "%\n";
    return 0;
}

static int runVerify(const std::string& originalPath, const std::string& imagePath)
{
    std::vector<uint8_t> original;
    filepix::Status st = filepix::readFileBytes(originalPath, original);
    if (st != filepix::Status::Ok) {
        return exitCode(st);
    }

    std::vector<uint8_t> recovered;
    st = filepix::decodeImageToBytes(imagePath, recovered);
    if (st != filepix::Status::Ok) {
        return exitCode(st);
    }

    std::string a, b;
    if (!digest::sha256Hex(original, a) || !digest::sha256Hex(recovered, b)) {
        std::cerr << "[verify] digest failed\n";
        return 2;
    }

    const double ber = metrics::computeByteErrorRate(original, recovered);
    std::cout << "[verify] original  sha256 " << a << " (" << original.size() << " bytes)\n";
    std::cout << "[verify] recovered sha256 " << b << " (" << recovered.size() << " bytes)\n";
    std::cout << "[verify] BER = " << ber << "\n";

    if (a != b) {
        std::cerr << "[verify] MISMATCH\n";
        return 2;
    }
    std::cout << "[verify] OK\n";
    return 0;
}

int main(int argc, char** argv)
{
    filepix::CliParser cli;
    if (!cli.parse(argc, argv)) {
        std::cerr << "[cli] " << cli.error() << "\n";
        printUsage();
        return 1;
    }
    if (cli.helpRequested()) {
        printUsage();
        return 0;
    }
    const std::string cmd = cli.command();

    if (cmd == "encode" || cmd == "decode") {
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        if (in.empty() || out.empty()) {
            printUsage();
            return 1;
        }
        filepix::Status st = (cmd == "encode")
            ? filepix::encodeFileToImage(in, out)
            : filepix::decodeImageToFile(in, out);
        if (st != filepix::Status::Ok) {
            std::cerr << "[" << cmd << "] failed: " << filepix::statusName(st) << "\n";
        }
        return exitCode(st);
    }

    if (cmd == "info") {
        const std::string in = cli.get("in");
        if (in.empty()) {
            printUsage();
            return 1;
        }
        return runInfo(in);
    }

    if (cmd == "verify") {
        const std::string original = cli.get("original");
        const std::string image = cli.get("image");
        if (original.empty() || image.empty()) {
            printUsage();
            return 1;
        }
        return runVerify(original, image);
    }

    printUsage();
    return 1;
}
