/**
 * @file main.cpp
 * @brief ninep-stat: converts between YAML descriptions and the binary
 * wire form of back-to-back Stat records.
 *
 *   ninep-stat encode <records.yaml> <out.bin>
 *   ninep-stat decode <in.bin>
 */

#include "StatYaml.hpp"
#include "ninep/Result.hpp"
#include "ninep/StatReader.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

static void log_err(const std::string& msg)
{
    std::cerr << "ninep-stat: " << msg << "\n";
}

static void usage()
{
    log_err("Usage: ninep-stat encode <records.yaml> <out.bin>");
    log_err("       ninep-stat decode <in.bin>");
}

static std::vector<uint8_t> readFile(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        throw std::runtime_error("Failed to open file: " + path);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
}

static void writeFile(const std::string& path, const std::vector<uint8_t>& bytes)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    if (!out)
    {
        throw std::runtime_error("Failed to write file: " + path);
    }
}

static int encode(const std::string& yamlPath, const std::string& outPath)
{
    std::vector<ninep::Stat> stats = ninep::yaml::loadStats(yamlPath);

    std::vector<uint8_t> bytes(ninep::StatReader::sizeOfAll(stats));
    ninep::StatReader::writeAll(stats, bytes);
    writeFile(outPath, bytes);

    log_err("encoded " + std::to_string(stats.size()) + " records (" +
            std::to_string(bytes.size()) + " bytes) to " + outPath);
    return 0;
}

static int decode(const std::string& inPath)
{
    std::vector<uint8_t> bytes = readFile(inPath);

    auto result = ninep::attempt([&] { return ninep::StatReader::readAll(bytes); });
    if (!result)
    {
        log_err(inPath + ": " + result.error().what());
        return 1;
    }

    YAML::Emitter out;
    out << ninep::yaml::toYaml(result.value());
    std::cout << out.c_str() << "\n";
    return 0;
}

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        usage();
        return 1;
    }

    std::string command = argv[1];
    try
    {
        if (command == "encode" && argc == 4)
        {
            return encode(argv[2], argv[3]);
        }
        if (command == "decode" && argc == 3)
        {
            return decode(argv[2]);
        }
    }
    catch (const std::exception& e)
    {
        log_err("FATAL: " + std::string(e.what()));
        return 1;
    }

    usage();
    return 1;
}
